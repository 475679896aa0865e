#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace Eval {

/*
Hand categories, shared by 3-card and 5-card hands.
 a 3-card hand can only be HIGH_CARD, PAIR or THREE_OF_A_KIND, there's no 3
 on the 3-card scale, so bonus detection by category number works for both sizes
*/
enum Category : uint8_t {
    INVALID = 0,
    HIGH_CARD = 1,
    PAIR = 2,
    TWO_PAIR = 3,
    THREE_OF_A_KIND = 4,
    STRAIGHT = 5,
    FLUSH = 6,
    FULL_HOUSE = 7,
    FOUR_OF_A_KIND = 8,
    STRAIGHT_FLUSH = 9,
    ROYAL_FLUSH = 10
};

constexpr int MAX_TIEBREAKERS = 5;

/*
Score of a 3-card or 5-card hand.
 category first, then tiebreaker ranks (2..14) compared left to right
 a shorter tiebreaker list that matches the start of a longer one is the weaker hand

category INVALID marks an empty slot (used by the combination index for "absent")
kept at 7 bytes so the 5-card index stays small
*/
struct Score {
    uint8_t category = INVALID;
    uint8_t count = 0;
    std::array<uint8_t, MAX_TIEBREAKERS> tiebreakers{};

    bool isValid() const { return category != INVALID; }

    /*
    The historical decimal encoding: integer part is the category,
    each tiebreaker appended as a 2-digit group.
     pair of 2s with a 5 kicker -> 2.0205
     royal flush -> 10.0
    Parsed with strtod so the double is bit-identical to the stored indices.
    */
    double toDecimal() const;

    // decimal encoding with all digits, e.g. "6.1413121009"
    std::string toString() const;
};

// -1, 0 or 1
int compare(const Score& a, const Score& b);

inline bool operator<(const Score& a, const Score& b)  { return compare(a, b) < 0; }
inline bool operator>(const Score& a, const Score& b)  { return compare(a, b) > 0; }
inline bool operator<=(const Score& a, const Score& b) { return compare(a, b) <= 0; }
inline bool operator>=(const Score& a, const Score& b) { return compare(a, b) >= 0; }
inline bool operator==(const Score& a, const Score& b) { return compare(a, b) == 0; }
inline bool operator!=(const Score& a, const Score& b) { return compare(a, b) != 0; }

// "Full House", "Pair" ...
const char* categoryName(int category);

}
