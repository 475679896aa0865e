#include "game_state.hpp"
#include "arrange/arranger.hpp"
#include <stdexcept>
#include <string>

namespace Equilibrium {

Profile GameState::profile() const {
    Profile out;
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        out[i] = players[i].currentStrategy;
    }
    return out;
}

GameState makeGame(const std::vector<std::vector<Cards::Card>>& hands,
                   const Index::CombinationIndex& index3,
                   const Index::CombinationIndex& index5,
                   std::mt19937& rng) {
    if (hands.size() != NUM_PLAYERS) {
        throw std::invalid_argument("A game needs exactly 4 hands, got " + std::to_string(hands.size()));
    }

    GameState game;
    for (int i = 0; i < NUM_PLAYERS; ++i) {
        PlayerState& player = game.players[i];
        player.hand = hands[i];
        player.arrangements = Arrange::enumerateArrangements(hands[i], index3, index5);

        if (player.arrangements.empty()) {
            throw Arrange::NoLegalArrangements(Cards::handToString(hands[i]));
        }

        std::uniform_int_distribution<int> pick(0, static_cast<int>(player.arrangements.size()) - 1);
        player.currentStrategy = pick(rng);
    }
    return game;
}

}
