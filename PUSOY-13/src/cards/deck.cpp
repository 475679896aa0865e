#include "deck.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace Cards {

Deck::Deck() {
    cards_.reserve(DECK_SIZE);
    for (int id = 0; id < DECK_SIZE; ++id) {
        cards_.push_back(fromId(id));
    }
}

void Deck::shuffle(std::mt19937& rng) {
    std::shuffle(cards_.begin(), cards_.end(), rng);
}

std::vector<std::vector<Card>> Deck::deal(int numPlayers, int cardsEach) const {
    if (numPlayers < 1 || numPlayers > 4) {
        throw std::invalid_argument("Number of players must be between 1 and 4, got " + std::to_string(numPlayers));
    }
    if (cardsEach < 0 || numPlayers * cardsEach > static_cast<int>(cards_.size())) {
        throw std::invalid_argument("Not enough cards in the deck to deal");
    }

    std::vector<std::vector<Card>> hands(numPlayers);
    for (int p = 0; p < numPlayers; ++p) {
        auto first = cards_.begin() + p * cardsEach;
        hands[p].assign(first, first + cardsEach);
    }
    return hands;
}

}
