#include "payoff.hpp"
#include "eval/score.hpp"
#include <stdexcept>

namespace Payoff {

// CONFIGURATION

const int BASE_POINT = 1;
const int SWEEP_BONUS = 3;
const int OVERALL_WINNER_BONUS = 18;
const int OVERALL_LOSER_PENALTY = 6;

const int FRONT_TRIPS_BONUS = 3;
const int MIDDLE_FULL_HOUSE_BONUS = 2;
const int QUADS_BONUS = 4;
const int STRAIGHT_FLUSH_BONUS = 5;

namespace {

std::vector<const Arrange::Arrangement*> pointersTo(const std::vector<Arrange::Arrangement>& arrangements) {
    std::vector<const Arrange::Arrangement*> out;
    out.reserve(arrangements.size());
    for (const Arrange::Arrangement& a : arrangements) {
        out.push_back(&a);
    }
    return out;
}

// true if every row of a is strictly stronger than the same row of b
bool dominates(const Arrange::Arrangement& a, const Arrange::Arrangement& b) {
    return a.frontScore > b.frontScore &&
           a.middleScore > b.middleScore &&
           a.backScore > b.backScore;
}

}

int positionBonus(int position, int category) {
    switch (position) {
        case Arrange::FRONT:
            return category == Eval::THREE_OF_A_KIND ? FRONT_TRIPS_BONUS : 0;

        case Arrange::MIDDLE:
            if (category == Eval::STRAIGHT_FLUSH || category == Eval::ROYAL_FLUSH) return STRAIGHT_FLUSH_BONUS;
            if (category == Eval::FOUR_OF_A_KIND) return QUADS_BONUS;
            if (category == Eval::FULL_HOUSE) return MIDDLE_FULL_HOUSE_BONUS;
            return 0;

        case Arrange::BACK:
            if (category == Eval::STRAIGHT_FLUSH || category == Eval::ROYAL_FLUSH) return STRAIGHT_FLUSH_BONUS;
            if (category == Eval::FOUR_OF_A_KIND) return QUADS_BONUS;
            return 0;

        default:
            throw std::out_of_range("Position must be 0..2, got " + std::to_string(position));
    }
}

PairResult comparePair(const Arrange::Arrangement& a, const Arrange::Arrangement& b) {
    PairResult result{0, {0, 0, 0}};

    for (int pos = 0; pos < Arrange::NUM_POSITIONS; ++pos) {
        const Eval::Score& mine = a.score(pos);
        const Eval::Score& theirs = b.score(pos);

        int order = Eval::compare(mine, theirs);
        if (order > 0) {
            result.positions[pos] = BASE_POINT + positionBonus(pos, mine.category);
        } else if (order < 0) {
            result.positions[pos] = -(BASE_POINT + positionBonus(pos, theirs.category));
        }
        result.total += result.positions[pos];
    }

    bool wonAll = true;
    bool lostAll = true;
    for (int delta : result.positions) {
        if (delta <= 0) wonAll = false;
        if (delta >= 0) lostAll = false;
    }

    if (wonAll) result.total += SWEEP_BONUS;
    else if (lostAll) result.total -= SWEEP_BONUS;

    return result;
}

std::vector<int> overallBonus(const std::vector<const Arrange::Arrangement*>& arrangements) {
    const size_t n = arrangements.size();
    std::vector<int> bonus(n, 0);

    for (size_t i = 0; i < n; ++i) {
        bool hasBest = true;
        for (size_t j = 0; j < n && hasBest; ++j) {
            if (i != j && !dominates(*arrangements[i], *arrangements[j])) {
                hasBest = false;
            }
        }

        if (hasBest && n > 1) {
            for (size_t j = 0; j < n; ++j) {
                bonus[j] = (j == i) ? OVERALL_WINNER_BONUS : -OVERALL_LOSER_PENALTY;
            }
            break;
        }
    }
    return bonus;
}

std::vector<int> overallBonus(const std::vector<Arrange::Arrangement>& arrangements) {
    return overallBonus(pointersTo(arrangements));
}

std::vector<int> pairwiseTotals(const std::vector<const Arrange::Arrangement*>& arrangements) {
    const size_t n = arrangements.size();
    std::vector<int> totals(n, 0);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            int score = comparePair(*arrangements[i], *arrangements[j]).total;
            totals[i] += score;
            totals[j] -= score;
        }
    }
    return totals;
}

std::vector<int> pairwiseTotals(const std::vector<Arrange::Arrangement>& arrangements) {
    return pairwiseTotals(pointersTo(arrangements));
}

std::vector<int> scoreGame(const std::vector<const Arrange::Arrangement*>& arrangements) {
    std::vector<int> scores = pairwiseTotals(arrangements);
    std::vector<int> bonus = overallBonus(arrangements);
    for (size_t i = 0; i < scores.size(); ++i) {
        scores[i] += bonus[i];
    }
    return scores;
}

std::vector<int> scoreGame(const std::vector<Arrange::Arrangement>& arrangements) {
    return scoreGame(pointersTo(arrangements));
}

}
