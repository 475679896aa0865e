#include "card.hpp"
#include "card_utils.hpp"
#include <sstream>
#include <stdexcept>

namespace Cards {

std::string Card::toString() const {
    return std::string(CardUtils::rankLabel(value)) + CardUtils::SUIT_CHARS[suit];
}

Card makeCard(int value, int suit) {
    if (value < 2 || value > 14) {
        throw std::invalid_argument("Invalid card value: " + std::to_string(value));
    }
    if (suit < 0 || suit >= NUM_SUITS) {
        throw std::invalid_argument("Invalid suit index: " + std::to_string(suit));
    }
    Card card;
    card.value = static_cast<uint8_t>(value);
    card.suit = static_cast<uint8_t>(suit);
    return card;
}

Card fromId(int id) {
    if (id < 0 || id >= DECK_SIZE) {
        throw std::out_of_range("Card id out of range: " + std::to_string(id));
    }
    return makeCard(id % NUM_RANKS + 2, id / NUM_RANKS);
}

std::optional<Card> parseCard(const std::string& token) {

    // "AS" or "10S", nothing else
    if (token.size() != 2 && token.size() != 3) {
        return std::nullopt;
    }

    int value = 0;
    char suitChar = token.back();

    if (token.size() == 3) {
        // the only three letter rank is the ten
        if (token[0] != '1' || token[1] != '0') {
            return std::nullopt;
        }
        value = 10;
    } else {
        value = CardUtils::getRankValue(token[0]);
    }

    int suit = CardUtils::getSuitIndex(suitChar);

    if (value == 0 || suit == -1) {
        return std::nullopt;
    }

    return makeCard(value, suit);
}

std::optional<std::vector<Card>> parseHand(const std::string& handStr) {
    std::istringstream in(handStr);
    std::vector<Card> hand;
    uint64_t seen = 0;
    std::string token;

    while (in >> token) {
        auto card = parseCard(token);
        if (!card) {
            return std::nullopt;
        }

        // same card twice can't come out of one deck
        uint64_t bit = 1ULL << card->id();
        if (seen & bit) {
            return std::nullopt;
        }
        seen |= bit;

        hand.push_back(*card);
    }

    if (hand.size() != HAND_SIZE) {
        return std::nullopt;
    }
    return hand;
}

std::string handToString(const std::vector<Card>& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += ' ';
        out += cards[i].toString();
    }
    return out;
}

uint64_t toMask(const std::vector<Card>& cards) {
    uint64_t mask = 0;
    for (const Card& c : cards) {
        mask |= (1ULL << c.id());
    }
    return mask;
}

}
