#include <gtest/gtest.h>
#include "index/combination_index.hpp"
#include "eval/evaluator.hpp"
#include "cards/card.hpp"
#include <algorithm>
#include <memory>
#include <random>
#include <vector>

using namespace Index;

class CombinationIndexTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        index3_ = std::make_unique<CombinationIndex>(CombinationIndex::build(3));
        index5_ = std::make_unique<CombinationIndex>(CombinationIndex::build(5));
    }

    static void TearDownTestSuite() {
        index3_.reset();
        index5_.reset();
    }

    static std::unique_ptr<CombinationIndex> index3_;
    static std::unique_ptr<CombinationIndex> index5_;
};

std::unique_ptr<CombinationIndex> CombinationIndexTest::index3_;
std::unique_ptr<CombinationIndex> CombinationIndexTest::index5_;

TEST(BinomialTest, TableValues) {
    EXPECT_EQ(binomial(52, 3), 22100u);
    EXPECT_EQ(binomial(52, 5), 2598960u);
    EXPECT_EQ(binomial(13, 3), 286u);
    EXPECT_EQ(binomial(10, 5), 252u);
    EXPECT_EQ(binomial(4, 5), 0u);
    EXPECT_EQ(binomial(7, 0), 1u);
    EXPECT_EQ(binomial(53, 2), 0u);
}

TEST(BinomialTest, RankIsDenseAndOrdered) {
    const int first[3] = { 0, 1, 2 };
    const int last[3] = { 49, 50, 51 };
    EXPECT_EQ(combinationRank(first, 3), 0u);
    EXPECT_EQ(combinationRank(last, 3), 22099u);

    const int last5[5] = { 47, 48, 49, 50, 51 };
    EXPECT_EQ(combinationRank(last5, 5), 2598959u);

    // every 3-set gets its own slot
    std::vector<bool> hit(22100, false);
    for (int c2 = 2; c2 < 52; ++c2)
        for (int c1 = 1; c1 < c2; ++c1)
            for (int c0 = 0; c0 < c1; ++c0) {
                const int ids[3] = { c0, c1, c2 };
                size_t rank = combinationRank(ids, 3);
                ASSERT_LT(rank, hit.size());
                EXPECT_FALSE(hit[rank]);
                hit[rank] = true;
            }
}

TEST_F(CombinationIndexTest, FullSizes) {
    EXPECT_EQ(index3_->arity(), 3);
    EXPECT_EQ(index3_->size(), 22100u);
    EXPECT_EQ(index3_->capacity(), 22100u);

    EXPECT_EQ(index5_->arity(), 5);
    EXPECT_EQ(index5_->size(), 2598960u);
    EXPECT_EQ(index5_->capacity(), 2598960u);
}

TEST_F(CombinationIndexTest, LookupsMatchEvaluator) {
    std::mt19937 rng(2024);
    std::vector<int> ids(52);
    for (int i = 0; i < 52; ++i) ids[i] = i;

    for (int trial = 0; trial < 2000; ++trial) {
        std::shuffle(ids.begin(), ids.end(), rng);

        std::vector<int> key3(ids.begin(), ids.begin() + 3);
        auto score3 = index3_->find(key3);
        ASSERT_TRUE(score3.has_value());
        EXPECT_EQ(*score3, Eval::evaluate3({ Cards::fromId(key3[0]), Cards::fromId(key3[1]), Cards::fromId(key3[2]) }));

        std::vector<int> key5(ids.begin(), ids.begin() + 5);
        auto score5 = index5_->find(key5);
        ASSERT_TRUE(score5.has_value());
        Eval::Score expected = Eval::evaluate5({ Cards::fromId(key5[0]), Cards::fromId(key5[1]), Cards::fromId(key5[2]),
                                                 Cards::fromId(key5[3]), Cards::fromId(key5[4]) });
        EXPECT_EQ(*score5, expected);
        EXPECT_EQ(score5->count, expected.count);
    }
}

TEST_F(CombinationIndexTest, KeyOrderDoesNotMatter) {
    // AS KS QS JS 10S
    auto royal = index5_->find({ 51, 50, 49, 48, 47 });
    ASSERT_TRUE(royal.has_value());
    EXPECT_EQ(royal->category, Eval::ROYAL_FLUSH);
    EXPECT_EQ(*index5_->find({ 47, 49, 51, 48, 50 }), *royal);

    const int sorted[5] = { 47, 48, 49, 50, 51 };
    EXPECT_EQ(*index5_->findSorted(sorted), *royal);

    // 2C 3C 4C
    auto low = index3_->find({ 2, 0, 1 });
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->category, Eval::HIGH_CARD);
    EXPECT_EQ(low->tiebreakers[0], 4);
}

TEST_F(CombinationIndexTest, BadKeysAreAbsent) {
    EXPECT_FALSE(index3_->find({ 0, 1 }).has_value());
    EXPECT_FALSE(index3_->find({ 0, 1, 2, 3 }).has_value());
    EXPECT_FALSE(index3_->find({ 0, 0, 1 }).has_value());
    EXPECT_FALSE(index3_->find({ 0, 1, 52 }).has_value());
    EXPECT_FALSE(index3_->find({ -1, 1, 2 }).has_value());
    EXPECT_FALSE(index5_->find({ 0, 1, 2 }).has_value());

    EXPECT_THROW(index3_->at({ 0, 0, 1 }), std::out_of_range);
    EXPECT_NO_THROW(index3_->at({ 0, 1, 2 }));
}

TEST_F(CombinationIndexTest, RebuildIsIdentical) {
    CombinationIndex again = CombinationIndex::build(3);
    ASSERT_EQ(again.size(), index3_->size());

    for (int c2 = 2; c2 < 52; ++c2)
        for (int c1 = 1; c1 < c2; ++c1)
            for (int c0 = 0; c0 < c1; ++c0) {
                const int ids[3] = { c0, c1, c2 };
                auto a = again.findSorted(ids);
                auto b = index3_->findSorted(ids);
                ASSERT_TRUE(a.has_value() && b.has_value());
                EXPECT_EQ(a->toString(), b->toString());
            }
}

TEST(PartialIndexTest, FromEntries) {
    Eval::Score trips = Eval::evaluate3({ Cards::fromId(12), Cards::fromId(25), Cards::fromId(38) });

    CombinationIndex partial = CombinationIndex::fromEntries(3, {
        { { 38, 12, 25 }, trips },
    });

    EXPECT_EQ(partial.size(), 1u);
    EXPECT_EQ(partial.capacity(), 22100u);
    ASSERT_TRUE(partial.find({ 12, 25, 38 }).has_value());
    EXPECT_EQ(*partial.find({ 25, 38, 12 }), trips);

    EXPECT_FALSE(partial.find({ 0, 1, 2 }).has_value());
    EXPECT_THROW(partial.at({ 0, 1, 2 }), std::out_of_range);
}

TEST(PartialIndexTest, RepeatedKeyKeepsLastScore) {
    Eval::Score high = Eval::evaluate3({ Cards::fromId(0), Cards::fromId(1), Cards::fromId(3) });
    Eval::Score trips = Eval::evaluate3({ Cards::fromId(12), Cards::fromId(25), Cards::fromId(38) });

    CombinationIndex partial = CombinationIndex::fromEntries(3, {
        { { 0, 1, 3 }, high },
        { { 3, 1, 0 }, trips },
    });

    EXPECT_EQ(partial.size(), 1u);
    EXPECT_EQ(*partial.find({ 0, 1, 3 }), trips);
}

TEST(PartialIndexTest, InvalidInputThrows) {
    Eval::Score high = Eval::evaluate3({ Cards::fromId(0), Cards::fromId(1), Cards::fromId(3) });

    EXPECT_THROW(CombinationIndex::fromEntries(3, { { { 0, 1 }, high } }), std::invalid_argument);
    EXPECT_THROW(CombinationIndex::fromEntries(3, { { { 0, 1, 1 }, high } }), std::invalid_argument);
    EXPECT_THROW(CombinationIndex::fromEntries(3, { { { 0, 1, 60 }, high } }), std::invalid_argument);
    EXPECT_THROW(CombinationIndex::fromEntries(3, { { { 0, 1, 3 }, Eval::Score() } }), std::invalid_argument);

    EXPECT_THROW(CombinationIndex::fromEntries(4, {}), std::invalid_argument);
    EXPECT_THROW(CombinationIndex::build(4), std::invalid_argument);

    CombinationIndex empty = CombinationIndex::fromEntries(5, {});
    EXPECT_EQ(empty.size(), 0u);
}
