// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RecommendationQuery
 */

#include <gtest/gtest.h>
#include "similarity/recommendation_query.hpp"

#include <vector>

using namespace itemsim::similarity;

class RecommendationQueryTest : public ::testing::Test {
protected:
    QueryOptions open(int topN = 10) const {
        QueryOptions options;
        options.scoreThreshold = 0.0;
        options.minSupport = 0;
        options.topN = topN;
        return options;
    }

    std::vector<ScoredPair> pairs_{
        {1, 2, 0.99, 60},
        {1, 3, 0.98, 120},
        {3, 4, 0.995, 300},
        {1, 5, 0.50, 500},
        {0, 1, 0.999, 55},
    };
};

TEST_F(RecommendationQueryTest, DefaultThresholds) {
    QueryOptions options;
    EXPECT_DOUBLE_EQ(options.scoreThreshold, 0.97);
    EXPECT_EQ(options.minSupport, 50);
    EXPECT_EQ(options.topN, 10);
}

TEST_F(RecommendationQueryTest, OnlySupportTenFails) {
    std::vector<ScoredPair> pairs{{7, 8, 0.99, 10}};
    auto result = RecommendationQuery::run(pairs, 7, QueryOptions{});
    EXPECT_TRUE(result.byScore.empty());
    EXPECT_TRUE(result.bySupport.empty());
}

TEST_F(RecommendationQueryTest, TargetOnEitherSide) {
    auto result = RecommendationQuery::run(pairs_, 1, QueryOptions{});

    ASSERT_EQ(result.byScore.size(), 3);
    EXPECT_EQ(result.byScore[0].itemId, 0);
    EXPECT_EQ(result.byScore[1].itemId, 2);
    EXPECT_EQ(result.byScore[2].itemId, 3);

    ASSERT_EQ(result.bySupport.size(), 3);
    EXPECT_EQ(result.bySupport[0].itemId, 3);
    EXPECT_EQ(result.bySupport[1].itemId, 2);
    EXPECT_EQ(result.bySupport[2].itemId, 0);
}

TEST_F(RecommendationQueryTest, ThresholdsAreStrict) {
    std::vector<ScoredPair> pairs{{1, 2, 0.97, 100}, {1, 3, 0.99, 50}};
    auto result = RecommendationQuery::run(pairs, 1, QueryOptions{});
    EXPECT_TRUE(result.empty());
}

TEST_F(RecommendationQueryTest, UnknownTargetIsEmpty) {
    auto result = RecommendationQuery::run(pairs_, 99, open());
    EXPECT_TRUE(result.empty());
}

TEST_F(RecommendationQueryTest, TopNTruncates) {
    auto result = RecommendationQuery::run(pairs_, 1, open(2));
    ASSERT_EQ(result.byScore.size(), 2);
    ASSERT_EQ(result.bySupport.size(), 2);
    EXPECT_EQ(result.byScore[0].itemId, 0);
    EXPECT_EQ(result.bySupport[0].itemId, 5);
}

TEST_F(RecommendationQueryTest, NonPositiveTopNIsEmpty) {
    EXPECT_TRUE(RecommendationQuery::run(pairs_, 1, open(0)).empty());
    EXPECT_TRUE(RecommendationQuery::run(pairs_, 1, open(-3)).empty());
}

TEST_F(RecommendationQueryTest, TiesBreakOnLowerItemId) {
    std::vector<ScoredPair> pairs{
        {1, 9, 0.99, 70}, {1, 4, 0.99, 70}, {1, 6, 0.99, 70}};
    auto result = RecommendationQuery::run(pairs, 1, QueryOptions{});

    ASSERT_EQ(result.byScore.size(), 3);
    EXPECT_EQ(result.byScore[0].itemId, 4);
    EXPECT_EQ(result.byScore[1].itemId, 6);
    EXPECT_EQ(result.byScore[2].itemId, 9);
    EXPECT_EQ(result.bySupport[0].itemId, 4);
    EXPECT_EQ(result.bySupport[1].itemId, 6);
    EXPECT_EQ(result.bySupport[2].itemId, 9);
}

TEST_F(RecommendationQueryTest, TieBreakSurvivesTruncation) {
    std::vector<ScoredPair> pairs;
    for (ItemId other = 20; other > 1; --other) {
        pairs.push_back({1, other, 0.99, 80});
    }
    auto result = RecommendationQuery::run(pairs, 1, QueryOptions{});

    ASSERT_EQ(result.byScore.size(), 10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(result.byScore[i].itemId, i + 2);
        EXPECT_EQ(result.bySupport[i].itemId, i + 2);
    }
}

TEST_F(RecommendationQueryTest, RecommendationCarriesScoreAndSupport) {
    auto result = RecommendationQuery::run(pairs_, 4, open());
    ASSERT_EQ(result.byScore.size(), 1);
    EXPECT_EQ(result.byScore[0], (Recommendation{3, 0.995, 300}));
}
