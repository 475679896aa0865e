#pragma once

#include "arrangement.hpp"
#include "cards/card.hpp"
#include "index/combination_index.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace Arrange {

// a dealt hand with no legal split can't be played, the caller has to re-deal
class NoLegalArrangements : public std::runtime_error {
public:
    explicit NoLegalArrangements(const std::string& hand)
        : std::runtime_error("No valid arrangements found for hand: " + hand) {}
};

/*
All legal (front, middle, back) splits of a 13-card hand.

 - cards are ordered by id first, so hand position i is the i-th lowest card id
 - fronts are the 3-of-13 position patterns in ascending order (286)
 - for each front the middles are the 5-of-10 patterns over the remaining positions (252),
   the back is whatever is left
 - legal means front < middle <= back
 - a row missing from its index is skipped, not an error (partial indices are fine)

the output order only depends on the hand's card set, never on the order it was passed in
throws std::invalid_argument unless the hand holds 13 distinct cards
an empty result is returned as is, game setup turns it into NoLegalArrangements
*/
std::vector<Arrangement> enumerateArrangements(const std::vector<Cards::Card>& hand,
                                               const Index::CombinationIndex& index3,
                                               const Index::CombinationIndex& index5);

}
