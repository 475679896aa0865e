#pragma once

#include <cctype>
#include <cstdint>

namespace CardUtils {

    // suit order used for card ids: clubs, diamonds, hearts, spades
    constexpr char SUIT_CHARS[4] = { 'C', 'D', 'H', 'S' };

    // if rank is lowercase, uppercase it
    inline char normalizeRank(char r) {
        return std::toupper(static_cast<unsigned char>(r));
    }

    // suits are stored uppercase ('10d' and '10D' are the same card)
    inline char normalizeSuit(char s) {
        return std::toupper(static_cast<unsigned char>(s));
    }

    // turn a single rank letter into its point value 2..14 (or 0 if garbage)
    // the ten is handled by the caller since it's written as "10" (or 'T')
    inline int getRankValue(char r) {
        switch (normalizeRank(r)) {
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'T': return 10;
            case 'J': return 11;
            case 'Q': return 12;
            case 'K': return 13;
            case 'A': return 14;
            default:  return 0;
        }
    }

    // suit letter to suit index (or -1 if garbage)
    inline int getSuitIndex(char s) {
        switch (normalizeSuit(s)) {
            case 'C': return 0;
            case 'D': return 1;
            case 'H': return 2;
            case 'S': return 3;
            default:  return -1;
        }
    }

    // printable rank, ten keeps its two digits
    inline const char* rankLabel(int value) {
        static const char* LABELS[15] = {
            "?", "?", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
        };
        return (value >= 2 && value <= 14) ? LABELS[value] : "?";
    }

}
