#pragma once

#include "cards/card.hpp"
#include "eval/score.hpp"
#include <array>
#include <string>

namespace Arrange {

// row indices, also used by the payoff model for per-position deltas
constexpr int FRONT = 0;
constexpr int MIDDLE = 1;
constexpr int BACK = 2;
constexpr int NUM_POSITIONS = 3;

/*
One way of playing a 13-card hand: 3 cards in front, 5 in the middle, 5 in the back,
each row with its score. The rows never share a card and together hold the whole hand.
Only the enumerator creates these.
*/
struct Arrangement {
    std::array<Cards::Card, 3> front;
    std::array<Cards::Card, 5> middle;
    std::array<Cards::Card, 5> back;

    Eval::Score frontScore;
    Eval::Score middleScore;
    Eval::Score backScore;

    const Eval::Score& score(int position) const;

    /*
    Front  (1.141209): AS QD 9C
    Middle (2.0813110403): ...
    Back   (8.1402): ...
    */
    std::string toString() const;
};

// front strictly below middle, middle no stronger than back
bool isLegalOrder(const Eval::Score& front, const Eval::Score& middle, const Eval::Score& back);

}
