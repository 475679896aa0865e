#include "evaluator.hpp"
#include <stdexcept>
#include <string>

namespace Eval {

namespace {

/*
Collapses the card values into groups ordered by group size, then by rank,
both descending. For every non-straight category this order is exactly the
tiebreaker list:
 quads        [q, kicker]
 full house   [trip, pair]
 trips        [trip, k1, k2]
 two pair     [hi pair, lo pair, kicker]
 pair         [pair, k1, k2, k3]
 high / flush [r1 .. r5]
returns the number of groups (distinct ranks)
*/
template <size_t N>
int groupRanks(const std::array<Cards::Card, N>& cards, Score& score, int& largestGroup) {
    int counts[15] = {0};
    for (const Cards::Card& c : cards) {
        counts[c.value]++;
    }

    int groups = 0;
    largestGroup = 0;
    for (int size = 4; size >= 1; --size) {
        for (int v = 14; v >= 2; --v) {
            if (counts[v] == size) {
                if (groups == 0) largestGroup = size;
                score.tiebreakers[groups++] = static_cast<uint8_t>(v);
            }
        }
    }
    score.count = static_cast<uint8_t>(groups);
    return groups;
}

inline void setSingle(Score& score, uint8_t category, int rank) {
    score.category = category;
    score.count = 1;
    score.tiebreakers = {};
    score.tiebreakers[0] = static_cast<uint8_t>(rank);
}

}

Score evaluate3(const std::array<Cards::Card, 3>& cards) {
    Score score;
    int largest = 0;
    int groups = groupRanks(cards, score, largest);

    if (largest == 3) {
        score.category = THREE_OF_A_KIND;
    } else if (groups == 2) {
        score.category = PAIR;
    } else {
        score.category = HIGH_CARD;
    }
    return score;
}

Score evaluate5(const std::array<Cards::Card, 5>& cards) {
    Score score;
    int largest = 0;
    int groups = groupRanks(cards, score, largest);

    bool flush = true;
    for (size_t i = 1; i < cards.size(); ++i) {
        if (cards[i].suit != cards[0].suit) {
            flush = false;
            break;
        }
    }

    // straight needs five distinct ranks, tiebreakers are already descending here
    int straightHigh = 0;
    if (groups == 5) {
        if (score.tiebreakers[0] - score.tiebreakers[4] == 4) {
            straightHigh = score.tiebreakers[0];
        } else if (score.tiebreakers[0] == 14 && score.tiebreakers[1] == 5) {
            // A-5-4-3-2, the ace plays low
            straightHigh = 5;
        }
    }

    if (flush && straightHigh) {
        if (straightHigh == 14) {
            score.category = ROYAL_FLUSH;
            score.count = 0;
            score.tiebreakers = {};
        } else {
            setSingle(score, STRAIGHT_FLUSH, straightHigh);
        }
        return score;
    }

    if (largest == 4) {
        score.category = FOUR_OF_A_KIND;
    } else if (largest == 3 && groups == 2) {
        score.category = FULL_HOUSE;
    } else if (flush) {
        score.category = FLUSH;
    } else if (straightHigh) {
        setSingle(score, STRAIGHT, straightHigh);
    } else if (largest == 3) {
        score.category = THREE_OF_A_KIND;
    } else if (groups == 3) {
        score.category = TWO_PAIR;
    } else if (groups == 4) {
        score.category = PAIR;
    } else {
        score.category = HIGH_CARD;
    }
    return score;
}

Score evaluate(const std::vector<Cards::Card>& cards) {
    if (cards.size() == 5) {
        return evaluate5({ cards[0], cards[1], cards[2], cards[3], cards[4] });
    }
    if (cards.size() == 3) {
        return evaluate3({ cards[0], cards[1], cards[2] });
    }
    throw std::invalid_argument("Hand must contain either 3 or 5 cards, got " + std::to_string(cards.size()));
}

int compareHands(const std::vector<Cards::Card>& hand1, const std::vector<Cards::Card>& hand2) {
    return compare(evaluate(hand1), evaluate(hand2));
}

}
