#include "arranger.hpp"
#include "bit_combinations.hpp"
#include <algorithm>
#include <array>

namespace Arrange {

namespace {

constexpr int FRONT_SIZE = 3;
constexpr int ROW_SIZE = 5;
constexpr uint32_t FULL_HAND = (1u << Cards::HAND_SIZE) - 1;

// ids of the positions set in bits, ascending because the hand is sorted by id
template <size_t N>
void rowIds(const std::array<int, Cards::HAND_SIZE>& ids, uint32_t bits, int* out) {
    size_t k = 0;
    while (bits && k < N) {
        out[k++] = ids[__builtin_ctz(bits)];
        bits &= bits - 1;
    }
}

template <size_t N>
std::array<Cards::Card, N> rowCards(const std::array<Cards::Card, Cards::HAND_SIZE>& cards, uint32_t bits) {
    std::array<Cards::Card, N> row;
    size_t k = 0;
    while (bits && k < N) {
        row[k++] = cards[__builtin_ctz(bits)];
        bits &= bits - 1;
    }
    return row;
}

}

std::vector<Arrangement> enumerateArrangements(const std::vector<Cards::Card>& hand,
                                               const Index::CombinationIndex& index3,
                                               const Index::CombinationIndex& index5) {
    if (hand.size() != Cards::HAND_SIZE) {
        throw std::invalid_argument("Hand must contain exactly 13 cards, got " + std::to_string(hand.size()));
    }
    if (index3.arity() != FRONT_SIZE || index5.arity() != ROW_SIZE) {
        throw std::invalid_argument("Arrangements need a 3-card and a 5-card index");
    }

    // sort by id so every row's ids come out already canonical
    std::array<Cards::Card, Cards::HAND_SIZE> cards;
    std::copy(hand.begin(), hand.end(), cards.begin());
    std::sort(cards.begin(), cards.end(),
              [](const Cards::Card& a, const Cards::Card& b) { return a.id() < b.id(); });

    std::array<int, Cards::HAND_SIZE> ids;
    for (int i = 0; i < Cards::HAND_SIZE; ++i) {
        ids[i] = cards[i].id();
        if (i > 0 && ids[i] == ids[i - 1]) {
            throw std::invalid_argument("Hand contains " + cards[i].toString() + " twice");
        }
    }

    // a 5-card row is one of 1287 position patterns, look each up once instead of per split
    // INVALID score = not in the index
    std::vector<Eval::Score> fiveScores(FULL_HAND + 1);
    BitCombinations fives(Cards::HAND_SIZE, ROW_SIZE);
    while (auto bits = fives.next()) {
        int rowKey[ROW_SIZE];
        rowIds<ROW_SIZE>(ids, *bits, rowKey);
        if (auto score = index5.findSorted(rowKey)) {
            fiveScores[*bits] = *score;
        }
    }

    std::vector<Arrangement> arrangements;

    BitCombinations fronts(Cards::HAND_SIZE, FRONT_SIZE);
    BitCombinations middles(Cards::HAND_SIZE - FRONT_SIZE, ROW_SIZE);

    while (auto frontBits = fronts.next()) {
        int frontKey[FRONT_SIZE];
        rowIds<FRONT_SIZE>(ids, *frontBits, frontKey);

        auto frontScore = index3.findSorted(frontKey);
        if (!frontScore) continue;

        // hand positions still free after the front, lowest first
        uint32_t remaining = FULL_HAND ^ *frontBits;
        int freePositions[Cards::HAND_SIZE - FRONT_SIZE];
        int freeCount = 0;
        for (uint32_t bits = remaining; bits; bits &= bits - 1) {
            freePositions[freeCount++] = __builtin_ctz(bits);
        }

        middles.reset();
        while (auto pick = middles.next()) {

            // map the 5-of-10 pick back onto hand positions
            uint32_t middleBits = 0;
            for (uint32_t bits = *pick; bits; bits &= bits - 1) {
                middleBits |= 1u << freePositions[__builtin_ctz(bits)];
            }

            const Eval::Score& middleScore = fiveScores[middleBits];
            if (!middleScore.isValid() || !(*frontScore < middleScore)) continue;

            uint32_t backBits = remaining ^ middleBits;
            const Eval::Score& backScore = fiveScores[backBits];
            if (!backScore.isValid() || !isLegalOrder(*frontScore, middleScore, backScore)) continue;

            Arrangement arrangement;
            arrangement.front = rowCards<FRONT_SIZE>(cards, *frontBits);
            arrangement.middle = rowCards<ROW_SIZE>(cards, middleBits);
            arrangement.back = rowCards<ROW_SIZE>(cards, backBits);
            arrangement.frontScore = *frontScore;
            arrangement.middleScore = middleScore;
            arrangement.backScore = backScore;
            arrangements.push_back(arrangement);
        }
    }

    return arrangements;
}

}
