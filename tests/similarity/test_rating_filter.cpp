// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RatingFilter
 */

#include <gtest/gtest.h>
#include "similarity/rating_filter.hpp"

#include <vector>

using namespace itemsim::similarity;

class RatingFilterTest : public ::testing::Test {
protected:
    std::vector<Rating> ratings_{
        {1, 10, 5}, {1, 11, 2}, {2, 10, 3}, {2, 12, 1}, {3, 11, 4},
    };
};

TEST_F(RatingFilterTest, DefaultThreshold) {
    RatingFilter filter;
    EXPECT_EQ(filter.minRating(), 3);
}

TEST_F(RatingFilterTest, ThresholdIsInclusive) {
    RatingFilter filter(3);
    EXPECT_TRUE(filter.accepts({1, 10, 3}));
    EXPECT_TRUE(filter.accepts({1, 10, 4}));
    EXPECT_FALSE(filter.accepts({1, 10, 2}));
}

TEST_F(RatingFilterTest, ApplyKeepsInputOrder) {
    RatingFilter filter(3);
    auto kept = filter.apply(ratings_);

    std::vector<Rating> expected{{1, 10, 5}, {2, 10, 3}, {3, 11, 4}};
    EXPECT_EQ(kept, expected);
}

TEST_F(RatingFilterTest, HighThresholdDropsEverything) {
    RatingFilter filter(6);
    EXPECT_TRUE(filter.apply(ratings_).empty());
}

TEST_F(RatingFilterTest, NegativeThresholdKeepsEverything) {
    RatingFilter filter(-1);
    EXPECT_EQ(filter.apply(ratings_).size(), ratings_.size());
}

TEST_F(RatingFilterTest, EmptyInput) {
    RatingFilter filter;
    EXPECT_TRUE(filter.apply({}).empty());
}
