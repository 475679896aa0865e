#pragma once

#include "arrange/arrangement.hpp"
#include "cards/card.hpp"
#include "index/combination_index.hpp"
#include <array>
#include <map>
#include <random>
#include <vector>

namespace Equilibrium {

constexpr int NUM_PLAYERS = 4;

// one arrangement index per player
using Profile = std::array<int, NUM_PLAYERS>;
using Payoffs = std::array<double, NUM_PLAYERS>;

struct PlayerState {
    std::vector<Cards::Card> hand;                    // the 13 dealt cards
    std::vector<Arrange::Arrangement> arrangements;   // every legal split, fixed for the whole run
    int currentStrategy = 0;                          // index into arrangements
    std::vector<double> payoffs;                      // realized payoff after every solver round

    const Arrange::Arrangement& current() const { return arrangements[currentStrategy]; }
};

struct HistoryEntry {
    Profile profile;
    Payoffs payoffs;
};

/*
Everything one solver run touches.
 payoffCache: full payoff vector per profile, filled lazily by the solver
 history: one (profile, payoffs) entry per solver iteration, oldest first
*/
struct GameState {
    std::array<PlayerState, NUM_PLAYERS> players;
    std::map<Profile, Payoffs> payoffCache;
    std::vector<HistoryEntry> history;

    Profile profile() const;
};

/*
Sets up a game from four dealt hands.
 every hand goes through the arrangement enumerator
 starting arrangement for each player is drawn uniformly from rng, so a seeded rng reproduces the run

throws std::invalid_argument unless there are exactly 4 hands,
Arrange::NoLegalArrangements if some hand has no legal split
*/
GameState makeGame(const std::vector<std::vector<Cards::Card>>& hands,
                   const Index::CombinationIndex& index3,
                   const Index::CombinationIndex& index5,
                   std::mt19937& rng);

}
