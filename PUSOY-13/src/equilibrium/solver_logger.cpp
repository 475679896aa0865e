#include "solver_logger.hpp"
#include <iomanip>
#include <stdexcept>

namespace Equilibrium {

namespace {

void writeProfile(std::ofstream& file, const Profile& profile) {
    file << "(";
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        if (i > 0) file << ", ";
        file << profile[i];
    }
    file << ")";
}

void writePayoffs(std::ofstream& file, const Payoffs& payoffs) {
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        if (i > 0) file << " ";
        file << std::showpos << std::fixed << std::setprecision(0) << payoffs[i] << std::noshowpos;
    }
}

}

SolverLogger::SolverLogger(const std::string& filename)
{
    file_.open(filename);
    if (!file_) throw std::runtime_error("Failed to open log file: " + filename);
}

SolverLogger::~SolverLogger() {
    if (file_.is_open()) file_.close();
}

// after each best-response round
void SolverLogger::logIteration(int iter, const Profile& profile, const Payoffs& payoffs, bool improved) {
    file_ << "Iteration: " << iter << ", Profile: ";
    writeProfile(file_, profile);
    file_ << ", Payoffs: ";
    writePayoffs(file_, payoffs);
    file_ << ", Improved: " << (improved ? "yes" : "no") << "\n";
}

void SolverLogger::logCycle(const CycleWindow& window, const CycleStats& stats, const HistoryEntry& chosen) {
    file_ << "\n--- Cycle ---\n";
    file_ << "Length: " << window.length << ", Starts at: " << window.start << "\n";
    file_ << "Unique profiles: " << stats.uniqueProfiles << "\n";
    file_ << "Player, Mean, Min, Max, Variance, Total\n";

    for (int i = 0; i < NUM_PLAYERS; ++i) {
        file_ << (i + 1) << ", "
              << std::fixed << std::setprecision(2)
              << stats.mean[i] << ", "
              << stats.min[i] << ", "
              << stats.max[i] << ", "
              << stats.variance[i] << ", "
              << stats.total[i] << "\n";
    }

    file_ << "Chosen: ";
    writeProfile(file_, chosen.profile);
    file_ << " -> ";
    writePayoffs(file_, chosen.payoffs);
    file_ << "\n";
}

void SolverLogger::logSummary(const std::string& outcome, int iterations, size_t cachedProfiles, const Payoffs& finalPayoffs) {
    file_ << "\n--- Solver Summary ---\n";
    file_ << "Outcome:         " << outcome << "\n";
    file_ << "Iterations:      " << iterations << "\n";
    file_ << "Cached profiles: " << cachedProfiles << "\n";
    file_ << "Final payoffs:   ";
    writePayoffs(file_, finalPayoffs);
    file_ << "\n----------------------\n\n";
}

}
