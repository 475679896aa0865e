#pragma once

#include "cycle_analysis.hpp"
#include "game_state.hpp"
#include <cstddef>
#include <fstream>
#include <string>

namespace Equilibrium {

/*
Text log of one best-response run.
 one line per iteration, a cycle section if a cycle was resolved, a summary at the end
 throws std::runtime_error if the file can't be opened
*/
class SolverLogger {
public:
    explicit SolverLogger(const std::string& filename);
    ~SolverLogger();

    void logIteration(int iter, const Profile& profile, const Payoffs& payoffs, bool improved);
    void logCycle(const CycleWindow& window, const CycleStats& stats, const HistoryEntry& chosen);
    void logSummary(const std::string& outcome, int iterations, size_t cachedProfiles, const Payoffs& finalPayoffs);

private:
    std::ofstream file_;
};

}
