// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for PairAggregator
 */

#include <gtest/gtest.h>
#include "similarity/exception.hpp"
#include "similarity/pair_aggregator.hpp"
#include "similarity/pair_expander.hpp"

#include <limits>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

using namespace itemsim::similarity;

namespace {

auto randomProfiles(unsigned seed, int users, int items)
    -> std::vector<UserProfile> {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> pick(0, 2);
    std::uniform_int_distribution<int> value(1, 5);

    std::vector<UserProfile> profiles;
    for (UserId user = 1; user <= users; ++user) {
        UserProfile profile{user, {}};
        for (ItemId item = 1; item <= items; ++item) {
            if (pick(rng) == 0) {
                profile.ratings.push_back({item, value(rng)});
            }
        }
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

}  // namespace

class PairAggregatorTest : public ::testing::Test {
protected:
    PairAggregator aggregator_;
};

TEST_F(PairAggregatorTest, ThreeUserScenario) {
    // u3 rated both items 1, below the threshold, and never reaches here
    aggregator_.absorbProfile({1, {{1, 5}, {2, 5}}});
    aggregator_.absorbProfile({2, {{1, 4}, {2, 4}}});

    const auto* aggregate = aggregator_.find(PairKey{1, 2});
    ASSERT_NE(aggregate, nullptr);
    EXPECT_EQ(aggregate->sumProduct, 41.0);
    EXPECT_EQ(aggregate->sumSqA, 41.0);
    EXPECT_EQ(aggregate->sumSqB, 41.0);
    EXPECT_EQ(aggregate->supportCount, 2);
    EXPECT_EQ(aggregator_.usersAbsorbed(), 2);
    EXPECT_EQ(aggregator_.contributionCount(), 2);
}

TEST_F(PairAggregatorTest, AccumulateRejectsUnorderedPair) {
    EXPECT_THROW(aggregator_.accumulate({5, 3, 1, 1}), std::invalid_argument);
    EXPECT_THROW(aggregator_.accumulate({5, 5, 1, 1}), std::invalid_argument);
    EXPECT_EQ(aggregator_.pairCount(), 0);
}

TEST_F(PairAggregatorTest, SingleRatingUserAddsNothing) {
    EXPECT_EQ(aggregator_.absorbProfile({1, {{10, 5}}}), 0);
    EXPECT_EQ(aggregator_.pairCount(), 0);
    EXPECT_EQ(aggregator_.usersAbsorbed(), 1);
}

TEST_F(PairAggregatorTest, FinalizeFreezes) {
    aggregator_.accumulate({1, 2, 3, 4});
    auto table = aggregator_.finalize();

    EXPECT_EQ(table.size(), 1);
    EXPECT_TRUE(aggregator_.isFinalized());
    EXPECT_THROW(aggregator_.accumulate({1, 2, 3, 4}), std::logic_error);
    EXPECT_THROW((void)aggregator_.finalize(), std::logic_error);
}

TEST_F(PairAggregatorTest, MergeDrainsOther) {
    PairAggregator other;
    other.absorbProfile({1, {{1, 3}, {2, 4}, {3, 5}}});
    aggregator_.absorbProfile({2, {{1, 5}, {2, 5}}});

    aggregator_.merge(std::move(other));

    EXPECT_EQ(aggregator_.pairCount(), 3);
    EXPECT_EQ(aggregator_.contributionCount(), 4);
    EXPECT_EQ(aggregator_.usersAbsorbed(), 2);
    EXPECT_EQ(aggregator_.find(PairKey{1, 2})->supportCount, 2);
}

TEST_F(PairAggregatorTest, CombineIsCommutativeAndAssociative) {
    PairAggregate x;
    x.absorb({1, 2, 5, 4});
    PairAggregate y;
    y.absorb({1, 2, 3, 3});
    y.absorb({1, 2, 1, 5});
    PairAggregate z;
    z.absorb({1, 2, 2, 2});

    EXPECT_EQ(combine(x, y), combine(y, x));
    EXPECT_EQ(combine(combine(x, y), z), combine(x, combine(y, z)));
    EXPECT_EQ(combine(x, PairAggregate{}), x);
}

TEST_F(PairAggregatorTest, PartitionedStreamMatchesFullStream) {
    auto profiles = randomProfiles(7, 60, 15);

    PairAggregator full;
    for (const auto& profile : profiles) {
        full.absorbProfile(profile);
    }

    // Interleaved split, merged in the opposite order
    PairAggregator even;
    PairAggregator odd;
    for (std::size_t i = 0; i < profiles.size(); ++i) {
        (i % 2 == 0 ? even : odd).absorbProfile(profiles[i]);
    }
    odd.merge(std::move(even));

    auto expected = full.finalize();
    auto actual = odd.finalize();
    EXPECT_EQ(actual, expected);
}

TEST_F(PairAggregatorTest, SupportCountMatchesBruteForce) {
    auto profiles = randomProfiles(11, 40, 12);
    for (const auto& profile : profiles) {
        aggregator_.absorbProfile(profile);
    }
    auto table = aggregator_.finalize();

    std::map<PairKey, SupportCount> reference;
    for (ItemId a = 1; a <= 12; ++a) {
        for (ItemId b = a + 1; b <= 12; ++b) {
            SupportCount shared = 0;
            for (const auto& profile : profiles) {
                bool hasA = false;
                bool hasB = false;
                for (const auto& rating : profile.ratings) {
                    hasA = hasA || rating.itemId == a;
                    hasB = hasB || rating.itemId == b;
                }
                if (hasA && hasB) {
                    ++shared;
                }
            }
            if (shared > 0) {
                reference[PairKey{a, b}] = shared;
            }
        }
    }

    ASSERT_EQ(table.size(), reference.size());
    for (const auto& [key, support] : reference) {
        ASSERT_TRUE(table.contains(key));
        EXPECT_EQ(table.at(key).supportCount, support);
    }
}

TEST_F(PairAggregatorTest, ProductOverflowDetected) {
    const RatingValue huge = 1 << 27;  // huge * huge == 2^54
    EXPECT_THROW(aggregator_.accumulate({1, 2, huge, huge}),
                 AggregationOverflowException);
}

TEST_F(PairAggregatorTest, SumOverflowLeavesAggregateUntouched) {
    const RatingValue big = 1 << 26;  // big * big == 2^52
    aggregator_.accumulate({1, 2, big, big});
    const auto before = *aggregator_.find(PairKey{1, 2});

    EXPECT_THROW(aggregator_.accumulate({1, 2, big, big}),
                 AggregationOverflowException);
    EXPECT_EQ(*aggregator_.find(PairKey{1, 2}), before);
}

TEST_F(PairAggregatorTest, MergeOverflowDetected) {
    PairAggregate near;
    near.sumProduct = PairAggregate::EXACT_LIMIT - 1.0;
    PairAggregate one;
    one.absorb({1, 2, 1, 1});

    EXPECT_THROW((void)combine(near, one), AggregationOverflowException);
}

TEST_F(PairAggregatorTest, SupportCountOverflowDetected) {
    PairAggregate saturated;
    saturated.supportCount = std::numeric_limits<SupportCount>::max();
    EXPECT_THROW(saturated.absorb({1, 2, 1, 1}), AggregationOverflowException);
}
