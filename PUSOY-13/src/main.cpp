// deals four random hands, lists each player's arrangements and runs the best-response solver
#include "arrange/arranger.hpp"
#include "cards/deck.hpp"
#include "equilibrium/game_state.hpp"
#include "equilibrium/solver.hpp"
#include "index/combination_index.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>

// CONFIGURATION

const int MAX_DEALS = 20;
const int MAX_ITERATIONS = 100;
const char* SOLVER_LOG = "solver_log.txt";

int main() {
    using Clock = std::chrono::high_resolution_clock;

    try {
        auto t0 = Clock::now();
        Index::CombinationIndex index3 = Index::CombinationIndex::build(3, true);
        Index::CombinationIndex index5 = Index::CombinationIndex::build(5, true);
        auto t1 = Clock::now();

        std::mt19937 rng(std::random_device{}());

        Equilibrium::GameState game;
        bool dealt = false;
        for (int attempt = 0; attempt < MAX_DEALS && !dealt; ++attempt) {
            Cards::Deck deck;
            deck.shuffle(rng);
            try {
                game = Equilibrium::makeGame(deck.deal(Equilibrium::NUM_PLAYERS), index3, index5, rng);
                dealt = true;
            } catch (const Arrange::NoLegalArrangements& e) {
                std::cerr << e.what() << ", re-dealing\n";
            }
        }
        if (!dealt) {
            std::cerr << "No playable deal after " << MAX_DEALS << " attempts\n";
            return 1;
        }
        auto t2 = Clock::now();

        for (int i = 0; i < Equilibrium::NUM_PLAYERS; ++i) {
            const Equilibrium::PlayerState& player = game.players[i];
            std::cout << "\nPlayer " << (i + 1) << ": " << Cards::handToString(player.hand) << "\n";
            std::cout << "Legal arrangements: " << player.arrangements.size() << "\n";
        }

        Equilibrium::SolverConfig config;
        config.maxIterations = MAX_ITERATIONS;
        config.logPath = SOLVER_LOG;
        config.verbose = true;

        Equilibrium::EquilibriumSolver solver(game, config);
        Equilibrium::SolverResult result = solver.run();
        auto t3 = Clock::now();

        std::cout << "\nOutcome: " << Equilibrium::outcomeName(result.outcome)
                  << " (" << result.iterations << " iterations)\n";

        for (int i = 0; i < Equilibrium::NUM_PLAYERS; ++i) {
            const Equilibrium::PlayerState& player = game.players[i];
            std::cout << "\nPlayer " << (i + 1) << " plays arrangement " << result.profile[i]
                      << ", payoff " << std::showpos << std::fixed << std::setprecision(0)
                      << result.payoffs[i] << std::noshowpos << "\n";
            std::cout << player.arrangements[result.profile[i]].toString() << "\n";
        }

        auto seconds = [](Clock::time_point a, Clock::time_point b) {
            return std::chrono::duration<double>(b - a).count();
        };
        std::cout << "\nTiming\n" << std::setprecision(3)
                  << "  index build:  " << seconds(t0, t1) << "s\n"
                  << "  arrangements: " << seconds(t1, t2) << "s\n"
                  << "  solver:       " << seconds(t2, t3) << "s\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
