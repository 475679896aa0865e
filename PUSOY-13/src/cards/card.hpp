#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Cards {

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = 52;
constexpr int HAND_SIZE = 13;

/*
A single playing card.
 value: 2..14 (J = 11, Q = 12, K = 13, A = 14)
 suit:  0..3 (clubs, diamonds, hearts, spades)

Card ids are suit-major: id = suit * 13 + (value - 2)
 0 = 2C, 12 = AC, 13 = 2D ... 51 = AS
The id is what the combination index uses as a key.
*/
struct Card {
    uint8_t value;
    uint8_t suit;

    int rankIndex() const { return value - 2; }
    int id() const { return suit * NUM_RANKS + rankIndex(); }

    // "AS", "10D", "7H"
    std::string toString() const;

    bool operator==(const Card& other) const {
        return value == other.value && suit == other.suit;
    }
    bool operator!=(const Card& other) const {
        return !(*this == other);
    }
};

// builds a card from a value (2..14) and suit index (0..3), throws std::invalid_argument otherwise
Card makeCard(int value, int suit);

// inverse of Card::id(), throws std::out_of_range for ids outside 0..51
Card fromId(int id);

// two-letter token like "AS" or "7h", three letters for the ten ("10D"), 'T' also works
std::optional<Card> parseCard(const std::string& token);

// whitespace separated list of exactly 13 distinct cards, nullopt if anything is off
std::optional<std::vector<Card>> parseHand(const std::string& handStr);

// space separated tokens, in the order given
std::string handToString(const std::vector<Card>& cards);

// 52-bit mask with bit id() set for every card
uint64_t toMask(const std::vector<Card>& cards);

}
