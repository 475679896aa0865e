#include "score.hpp"
#include <cstdlib>

namespace Eval {

std::string Score::toString() const {
    std::string out = std::to_string(category) + ".";
    if (count == 0) {
        return out + "0";
    }
    for (int i = 0; i < count; ++i) {
        int r = tiebreakers[i];
        out += static_cast<char>('0' + r / 10);
        out += static_cast<char>('0' + r % 10);
    }
    return out;
}

double Score::toDecimal() const {
    // going through the string keeps the rounding identical to the stored values
    std::string text = toString();
    return std::strtod(text.c_str(), nullptr);
}

int compare(const Score& a, const Score& b) {
    if (a.category != b.category) {
        return a.category < b.category ? -1 : 1;
    }

    int n = a.count < b.count ? a.count : b.count;
    for (int i = 0; i < n; ++i) {
        if (a.tiebreakers[i] != b.tiebreakers[i]) {
            return a.tiebreakers[i] < b.tiebreakers[i] ? -1 : 1;
        }
    }

    // same prefix, the longer list has extra digits in the decimal encoding
    if (a.count != b.count) {
        return a.count < b.count ? -1 : 1;
    }
    return 0;
}

const char* categoryName(int category) {
    switch (category) {
        case HIGH_CARD:       return "High Card";
        case PAIR:            return "Pair";
        case TWO_PAIR:        return "Two Pair";
        case THREE_OF_A_KIND: return "Three of a Kind";
        case STRAIGHT:        return "Straight";
        case FLUSH:           return "Flush";
        case FULL_HOUSE:      return "Full House";
        case FOUR_OF_A_KIND:  return "Four of a Kind";
        case STRAIGHT_FLUSH:  return "Straight Flush";
        case ROYAL_FLUSH:     return "Royal Flush";
        default:              return "Invalid";
    }
}

}
