#pragma once

#include "cards/card.hpp"
#include "score.hpp"
#include <array>
#include <vector>

namespace Eval {

// 3-card hands: three of a kind, pair or high card
Score evaluate3(const std::array<Cards::Card, 3>& cards);

// 5-card hands: full ten category scale, ace plays low only in the wheel (A-2-3-4-5, high card 5)
Score evaluate5(const std::array<Cards::Card, 5>& cards);

// dispatches on size, throws std::invalid_argument unless there are exactly 3 or 5 cards
Score evaluate(const std::vector<Cards::Card>& cards);

// sign of the score comparison of two hands (1 if first is stronger)
int compareHands(const std::vector<Cards::Card>& hand1, const std::vector<Cards::Card>& hand2);

}
