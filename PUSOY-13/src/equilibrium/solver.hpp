#pragma once

#include "cycle_analysis.hpp"
#include "game_state.hpp"
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
Best-response dynamics over the four players' arrangement sets.

Every round:
 1. the current (profile, payoffs) goes into the history
 2. the history is checked for a cycle, if there is one the best entry of the last period
    is adopted and the run stops (CycleResolved)
 3. otherwise every player switches to its best response against the profile
    the round started with, all at the same time
 4. if nobody's payoff went up by more than 1e-6 the run stops (Converged)

running out of rounds is an outcome too (IterationLimitReached), nothing here throws for it
*/

namespace Equilibrium {

enum class Outcome {
    Converged,
    CycleResolved,
    IterationLimitReached
};

const char* outcomeName(Outcome outcome);

struct SolverConfig {
    int maxIterations = 100;
    std::string logPath;   // empty = no log file
    bool verbose = false;  // progress on std::cout
};

struct SolverResult {
    Outcome outcome;
    Profile profile;
    Payoffs payoffs;
    int iterations;                   // rounds started, history entries added
    std::optional<CycleStats> cycle;  // only for CycleResolved
};

class EquilibriumSolver {
public:
    // the solver updates strategies, realized payoffs, cache and history of the game in place
    explicit EquilibriumSolver(GameState& game, SolverConfig config = SolverConfig());

    // memoized, six pairwise comparisons plus the overall bonus
    const Payoffs& computePayoffs(const Profile& profile);

    // best arrangement for one player with the others fixed at profile, the first maximum wins
    std::pair<int, double> bestResponse(int player, const Profile& profile);

    SolverResult run();

private:
    GameState& game_;
    SolverConfig config_;
};

/*
Solver entry point on bare candidate lists.
 throws std::invalid_argument if a list is empty or initialProfile points outside it
*/
SolverResult runEquilibrium(const std::array<std::vector<Arrange::Arrangement>, NUM_PLAYERS>& candidates,
                            const Profile& initialProfile,
                            int maxIterations);

}
