#pragma once

#include "card.hpp"
#include <random>
#include <vector>

namespace Cards {

// standard 52-card deck, suit-major order until shuffled
class Deck {
public:
    Deck();

    // the generator is owned by the caller so deals can be reproduced from a seed
    void shuffle(std::mt19937& rng);

    /*
    Deals cardsEach consecutive cards to each player from the top of the deck.
     supports 1..4 players
     throws std::invalid_argument if the player count is off or the deck runs out
    */
    std::vector<std::vector<Card>> deal(int numPlayers, int cardsEach = HAND_SIZE) const;

    const std::vector<Card>& cards() const { return cards_; }

private:
    std::vector<Card> cards_;
};

}
