#include "solver.hpp"
#include "solver_logger.hpp"
#include "payoff/payoff.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace Equilibrium {

// CONFIGURATION

const double IMPROVEMENT_TOLERANCE = 1e-6;
const int PRINT_EVERY = 10;

namespace {

void printPayoffs(const Payoffs& payoffs) {
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        std::cout << (i > 0 ? " " : "")
                  << std::showpos << std::fixed << std::setprecision(0) << payoffs[i] << std::noshowpos;
    }
    std::cout << "\n";
}

void printCycle(const std::vector<HistoryEntry>& history, const CycleWindow& window,
                const CycleStats& stats, const HistoryEntry& chosen) {
    std::cout << "\nCycle detected of length " << window.length << "!\n";
    std::cout << "Unique strategy profiles: " << stats.uniqueProfiles << "\n";

    for (int i = 0; i < NUM_PLAYERS; ++i) {
        std::cout << "Player " << (i + 1) << ":\n";
        std::cout << "  Average:  " << std::showpos << std::fixed << std::setprecision(1) << stats.mean[i] << "\n";
        std::cout << "  Range:    [" << std::setprecision(0) << stats.min[i] << ", " << stats.max[i] << "]\n"
                  << std::noshowpos;
        std::cout << "  Variance: " << std::setprecision(2) << stats.variance[i] << "\n";
    }

    std::cout << "Cycle payoffs:\n";
    for (size_t k = window.start; k < window.start + window.length; ++k) {
        std::cout << "  ";
        printPayoffs(history[k].payoffs);
    }
    std::cout << "Chosen profile with payoffs: ";
    printPayoffs(chosen.payoffs);
}

}

const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Converged:             return "Converged";
        case Outcome::CycleResolved:         return "CycleResolved";
        case Outcome::IterationLimitReached: return "IterationLimitReached";
    }
    return "Unknown";
}

EquilibriumSolver::EquilibriumSolver(GameState& game, SolverConfig config)
: game_(game), config_(std::move(config)) {}

const Payoffs& EquilibriumSolver::computePayoffs(const Profile& profile) {
    auto cached = game_.payoffCache.find(profile);
    if (cached != game_.payoffCache.end()) return cached->second;

    std::vector<const Arrange::Arrangement*> arrangements(NUM_PLAYERS);
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        arrangements[i] = &game_.players[i].arrangements.at(profile[i]);
    }

    std::vector<int> scores = Payoff::scoreGame(arrangements);

    Payoffs payoffs;
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        payoffs[i] = static_cast<double>(scores[i]);
    }
    return game_.payoffCache.emplace(profile, payoffs).first->second;
}

std::pair<int, double> EquilibriumSolver::bestResponse(int player, const Profile& profile) {
    if (player < 0 || player >= NUM_PLAYERS) {
        throw std::out_of_range("Player must be 0..3, got " + std::to_string(player));
    }

    const int candidates = static_cast<int>(game_.players[player].arrangements.size());
    Profile trial = profile;

    int bestStrategy = -1;
    double bestPayoff = 0.0;

    for (int s = 0; s < candidates; ++s) {
        trial[player] = s;
        double payoff = computePayoffs(trial)[player];
        if (bestStrategy < 0 || payoff > bestPayoff) {
            bestStrategy = s;
            bestPayoff = payoff;
        }
    }
    return {bestStrategy, bestPayoff};
}

SolverResult EquilibriumSolver::run() {
    std::unique_ptr<SolverLogger> logger;
    if (!config_.logPath.empty()) {
        logger = std::make_unique<SolverLogger>(config_.logPath);
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    auto finish = [&](SolverResult result) {
        if (logger) {
            logger->logSummary(outcomeName(result.outcome), result.iterations,
                               game_.payoffCache.size(), result.payoffs);
        }
        if (config_.verbose) {
            std::cout << "\n" << outcomeName(result.outcome) << " after " << result.iterations << " iterations\n";
        }
        return result;
    };

    for (int iter = 0; iter < config_.maxIterations; ++iter) {
        const Profile current = game_.profile();
        const Payoffs oldPayoffs = computePayoffs(current);
        game_.history.push_back({current, oldPayoffs});

        if (auto window = detectCycle(game_.history)) {
            CycleStats stats = analyzeCycle(game_.history, *window);
            const HistoryEntry chosen = selectBestInCycle(game_.history, *window);

            if (logger) logger->logCycle(*window, stats, chosen);
            if (config_.verbose) printCycle(game_.history, *window, stats, chosen);

            for (int i = 0; i < NUM_PLAYERS; ++i) {
                game_.players[i].currentStrategy = chosen.profile[i];
                game_.players[i].payoffs.push_back(chosen.payoffs[i]);
            }
            return finish({Outcome::CycleResolved, chosen.profile, chosen.payoffs, iter + 1, stats});
        }

        // everybody answers the same start-of-round profile
        Profile next;
        for (int i = 0; i < NUM_PLAYERS; ++i) {
            next[i] = bestResponse(i, current).first;
        }
        for (int i = 0; i < NUM_PLAYERS; ++i) {
            game_.players[i].currentStrategy = next[i];
        }

        const Payoffs newPayoffs = computePayoffs(next);
        bool improved = false;
        for (int i = 0; i < NUM_PLAYERS; ++i) {
            game_.players[i].payoffs.push_back(newPayoffs[i]);
            if (newPayoffs[i] > oldPayoffs[i] + IMPROVEMENT_TOLERANCE) improved = true;
        }

        if (logger) logger->logIteration(iter, next, newPayoffs, improved);

        if (config_.verbose && (iter % PRINT_EVERY == 0 || !improved)) {
            double elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - startTime).count();
            std::cout << "\nIteration " << iter << " (elapsed: " << std::fixed << std::setprecision(2) << elapsed << "s)\n";
            std::cout << "Current payoffs: ";
            printPayoffs(newPayoffs);
        }

        if (!improved) {
            return finish({Outcome::Converged, next, newPayoffs, iter + 1, std::nullopt});
        }
    }

    const Profile last = game_.profile();
    const Payoffs lastPayoffs = computePayoffs(last);
    return finish({Outcome::IterationLimitReached, last, lastPayoffs,
                   std::max(config_.maxIterations, 0), std::nullopt});
}

SolverResult runEquilibrium(const std::array<std::vector<Arrange::Arrangement>, NUM_PLAYERS>& candidates,
                            const Profile& initialProfile,
                            int maxIterations) {
    GameState game;
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        if (candidates[i].empty()) {
            throw std::invalid_argument("Player " + std::to_string(i) + " has no candidate arrangements");
        }
        if (initialProfile[i] < 0 || initialProfile[i] >= static_cast<int>(candidates[i].size())) {
            throw std::invalid_argument("Initial strategy " + std::to_string(initialProfile[i]) +
                                        " is out of range for player " + std::to_string(i));
        }

        PlayerState& player = game.players[i];
        player.arrangements = candidates[i];
        player.currentStrategy = initialProfile[i];

        const Arrange::Arrangement& first = candidates[i].front();
        player.hand.assign(first.front.begin(), first.front.end());
        player.hand.insert(player.hand.end(), first.middle.begin(), first.middle.end());
        player.hand.insert(player.hand.end(), first.back.begin(), first.back.end());
    }

    SolverConfig config;
    config.maxIterations = maxIterations;
    EquilibriumSolver solver(game, config);
    return solver.run();
}

}
