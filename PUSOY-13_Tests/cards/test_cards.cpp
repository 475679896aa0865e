#include <gtest/gtest.h>
#include "cards/card.hpp"
#include "cards/deck.hpp"
#include <algorithm>
#include <random>
#include <set>

using namespace Cards;

TEST(CardTest, IdsAreSuitMajor) {
    EXPECT_EQ(makeCard(2, 0).id(), 0);    // 2C
    EXPECT_EQ(makeCard(14, 0).id(), 12);  // AC
    EXPECT_EQ(makeCard(2, 1).id(), 13);   // 2D
    EXPECT_EQ(makeCard(14, 3).id(), 51);  // AS

    for (int id = 0; id < DECK_SIZE; ++id) {
        EXPECT_EQ(fromId(id).id(), id);
    }
}

TEST(CardTest, OutOfRangeValuesThrow) {
    EXPECT_THROW(makeCard(1, 0), std::invalid_argument);
    EXPECT_THROW(makeCard(15, 0), std::invalid_argument);
    EXPECT_THROW(makeCard(10, 4), std::invalid_argument);
    EXPECT_THROW(fromId(-1), std::out_of_range);
    EXPECT_THROW(fromId(52), std::out_of_range);
}

TEST(ParseCardTest, TwoAndThreeLetterTokens) {
    auto ace = parseCard("AS");
    ASSERT_TRUE(ace.has_value());
    EXPECT_EQ(ace->value, 14);
    EXPECT_EQ(ace->suit, 3);

    auto ten = parseCard("10D");
    ASSERT_TRUE(ten.has_value());
    EXPECT_EQ(ten->value, 10);
    EXPECT_EQ(ten->suit, 1);

    // 'T' and lowercase work as well
    EXPECT_EQ(*parseCard("Td"), *ten);
    EXPECT_EQ(*parseCard("10d"), *ten);
    EXPECT_EQ(*parseCard("as"), *ace);
    EXPECT_EQ(*parseCard("7h"), makeCard(7, 2));
}

TEST(ParseCardTest, GarbageIsRejected) {
    EXPECT_FALSE(parseCard("").has_value());
    EXPECT_FALSE(parseCard("A").has_value());
    EXPECT_FALSE(parseCard("1S").has_value());
    EXPECT_FALSE(parseCard("11S").has_value());
    EXPECT_FALSE(parseCard("AX").has_value());
    EXPECT_FALSE(parseCard("ZS").has_value());
    EXPECT_FALSE(parseCard("10SS").has_value());
}

TEST(ParseCardTest, ToStringRoundTrip) {
    EXPECT_EQ(makeCard(10, 1).toString(), "10D");
    EXPECT_EQ(makeCard(11, 0).toString(), "JC");
    EXPECT_EQ(makeCard(2, 2).toString(), "2H");

    for (int id = 0; id < DECK_SIZE; ++id) {
        Card c = fromId(id);
        auto parsed = parseCard(c.toString());
        ASSERT_TRUE(parsed.has_value()) << c.toString();
        EXPECT_EQ(*parsed, c);
    }
}

TEST(ParseHandTest, ThirteenDistinctCards) {
    auto hand = parseHand("AC AD AH AS 2C 3D 4H 6S 7C 8D 9H JS QC");
    ASSERT_TRUE(hand.has_value());
    EXPECT_EQ(hand->size(), 13u);
    EXPECT_EQ(hand->front(), makeCard(14, 0));
    EXPECT_EQ(handToString(*hand), "AC AD AH AS 2C 3D 4H 6S 7C 8D 9H JS QC");

    // extra whitespace is fine
    EXPECT_TRUE(parseHand("  AC AD AH AS  2C 3D 4H 6S 7C 8D 9H JS\tQC ").has_value());
}

TEST(ParseHandTest, WrongSizeDuplicatesOrBadTokens) {
    EXPECT_FALSE(parseHand("AC AD AH AS 2C 3D 4H 6S 7C 8D 9H JS").has_value());
    EXPECT_FALSE(parseHand("AC AD AH AS 2C 3D 4H 6S 7C 8D 9H JS QC KC").has_value());
    EXPECT_FALSE(parseHand("AC AC AH AS 2C 3D 4H 6S 7C 8D 9H JS QC").has_value());
    EXPECT_FALSE(parseHand("AC AD AH AS 2C 3D 4H 6S 7C 8D 9H JS QX").has_value());
    EXPECT_FALSE(parseHand("").has_value());
}

TEST(ParseHandTest, MaskHasOneBitPerCard) {
    auto hand = parseHand("2C 3C 4C 5C 6C 7C 8C 9C 10C JC QC KC AC");
    ASSERT_TRUE(hand.has_value());
    EXPECT_EQ(toMask(*hand), (1ULL << 13) - 1);
}

TEST(DeckTest, FreshDeckHoldsEveryCardOnce) {
    Deck deck;
    ASSERT_EQ(deck.cards().size(), static_cast<size_t>(DECK_SIZE));
    for (int id = 0; id < DECK_SIZE; ++id) {
        EXPECT_EQ(deck.cards()[id].id(), id);
    }
}

TEST(DeckTest, SeededShuffleIsReproducible) {
    Deck a;
    Deck b;
    std::mt19937 rngA(42);
    std::mt19937 rngB(42);
    a.shuffle(rngA);
    b.shuffle(rngB);
    EXPECT_EQ(a.cards(), b.cards());

    // still a permutation
    EXPECT_EQ(toMask(a.cards()), (1ULL << DECK_SIZE) - 1);
}

TEST(DeckTest, DealFourHandsDisjoint) {
    Deck deck;
    std::mt19937 rng(7);
    deck.shuffle(rng);

    auto hands = deck.deal(4);
    ASSERT_EQ(hands.size(), 4u);

    uint64_t seen = 0;
    for (const auto& hand : hands) {
        ASSERT_EQ(hand.size(), static_cast<size_t>(HAND_SIZE));
        uint64_t mask = toMask(hand);
        EXPECT_EQ(seen & mask, 0u);
        seen |= mask;
    }
    EXPECT_EQ(seen, (1ULL << DECK_SIZE) - 1);
}

TEST(DeckTest, BadDealsThrow) {
    Deck deck;
    EXPECT_THROW(deck.deal(0), std::invalid_argument);
    EXPECT_THROW(deck.deal(5), std::invalid_argument);
    EXPECT_THROW(deck.deal(4, 14), std::invalid_argument);
    EXPECT_NO_THROW(deck.deal(1, 5));
}
