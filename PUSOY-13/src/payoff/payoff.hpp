#pragma once

#include "arrange/arrangement.hpp"
#include <array>
#include <vector>

/*
Tournament scoring between arrangements.

Per position (front, middle, back) the winner gets +1 and the loser -1,
plus a bonus for the winning hand's category:
 front:  three of a kind +3
 middle: full house +2, four of a kind +4, straight / royal flush +5
 back:   four of a kind +4, straight / royal flush +5 (no full house bonus)
the loser pays the same amount, exact ties are worth 0

Sweep: winning all three positions against one opponent is +3 more (losing all three -3)

Overall: a player whose front, middle and back each beat every other player's
corresponding row collects +18, everybody else pays 6
*/

namespace Payoff {

struct PairResult {
    int total;                                          // first player's net, sweep included
    std::array<int, Arrange::NUM_POSITIONS> positions;  // front, middle, back deltas for the first player
};

// bonus collected by the winner of a position holding this category
int positionBonus(int position, int category);

// scores a against b, the result for b is the exact negation
PairResult comparePair(const Arrange::Arrangement& a, const Arrange::Arrangement& b);

/*
+18 / -6 for the one player dominating every row, zeros otherwise.
 strict dominance of the front alone already rules out a second dominating player
*/
std::vector<int> overallBonus(const std::vector<const Arrange::Arrangement*>& arrangements);
std::vector<int> overallBonus(const std::vector<Arrange::Arrangement>& arrangements);

// sum of all pairwise totals per player, sums to zero
std::vector<int> pairwiseTotals(const std::vector<const Arrange::Arrangement*>& arrangements);
std::vector<int> pairwiseTotals(const std::vector<Arrange::Arrangement>& arrangements);

// pairwise totals plus the overall bonus
std::vector<int> scoreGame(const std::vector<const Arrange::Arrangement*>& arrangements);
std::vector<int> scoreGame(const std::vector<Arrange::Arrangement>& arrangements);

}
