// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for UserGrouper
 */

#include <gtest/gtest.h>
#include "similarity/exception.hpp"
#include "similarity/user_grouper.hpp"

#include <stdexcept>
#include <vector>

using namespace itemsim::similarity;

class UserGrouperTest : public ::testing::Test {
protected:
    auto makeGrouper(GroupingMode mode) -> UserGrouper {
        return UserGrouper(mode, [this](UserProfile&& profile) {
            profiles_.push_back(std::move(profile));
        });
    }

    std::vector<UserProfile> profiles_;
};

TEST_F(UserGrouperTest, BufferedGroupsInterleavedUsers) {
    auto grouper = makeGrouper(GroupingMode::BUFFERED);
    grouper.add({2, 20, 4});
    grouper.add({1, 12, 5});
    grouper.add({2, 10, 3});
    grouper.add({1, 11, 4});
    EXPECT_TRUE(profiles_.empty());

    grouper.finish();

    ASSERT_EQ(profiles_.size(), 2);
    EXPECT_EQ(profiles_[0].userId, 1);
    EXPECT_EQ(profiles_[1].userId, 2);
    EXPECT_EQ(grouper.usersEmitted(), 2);
}

TEST_F(UserGrouperTest, ProfilesAreSortedByItem) {
    auto grouper = makeGrouper(GroupingMode::BUFFERED);
    grouper.add({1, 30, 3});
    grouper.add({1, 10, 5});
    grouper.add({1, 20, 4});
    grouper.finish();

    ASSERT_EQ(profiles_.size(), 1);
    std::vector<ItemRating> expected{{10, 5}, {20, 4}, {30, 3}};
    EXPECT_EQ(profiles_[0].ratings, expected);
}

TEST_F(UserGrouperTest, DuplicateRatingLastWriteWins) {
    auto grouper = makeGrouper(GroupingMode::BUFFERED);
    grouper.add({1, 10, 3});
    grouper.add({1, 11, 4});
    grouper.add({1, 10, 5});
    grouper.finish();

    ASSERT_EQ(profiles_.size(), 1);
    std::vector<ItemRating> expected{{10, 5}, {11, 4}};
    EXPECT_EQ(profiles_[0].ratings, expected);
    EXPECT_EQ(grouper.duplicatesReplaced(), 1);
}

TEST_F(UserGrouperTest, ContiguousEmitsOnUserChange) {
    auto grouper = makeGrouper(GroupingMode::CONTIGUOUS);
    grouper.add({7, 10, 3});
    grouper.add({7, 11, 4});
    EXPECT_TRUE(profiles_.empty());

    grouper.add({3, 10, 5});
    ASSERT_EQ(profiles_.size(), 1);
    EXPECT_EQ(profiles_[0].userId, 7);

    grouper.finish();
    ASSERT_EQ(profiles_.size(), 2);
    EXPECT_EQ(profiles_[1].userId, 3);
}

TEST_F(UserGrouperTest, ContiguousRejectsReturningUser) {
    auto grouper = makeGrouper(GroupingMode::CONTIGUOUS);
    grouper.add({1, 10, 3});
    grouper.add({2, 10, 3});
    EXPECT_THROW(grouper.add({1, 11, 4}), MalformedInputException);
}

TEST_F(UserGrouperTest, ContiguousDuplicateLastWriteWins) {
    auto grouper = makeGrouper(GroupingMode::CONTIGUOUS);
    grouper.add({1, 10, 3});
    grouper.add({1, 10, 4});
    grouper.finish();

    ASSERT_EQ(profiles_.size(), 1);
    std::vector<ItemRating> expected{{10, 4}};
    EXPECT_EQ(profiles_[0].ratings, expected);
    EXPECT_EQ(grouper.duplicatesReplaced(), 1);
}

TEST_F(UserGrouperTest, AddAfterFinishThrows) {
    auto grouper = makeGrouper(GroupingMode::BUFFERED);
    grouper.finish();
    EXPECT_THROW(grouper.add({1, 10, 3}), std::logic_error);
}

TEST_F(UserGrouperTest, FinishIsIdempotent) {
    auto grouper = makeGrouper(GroupingMode::BUFFERED);
    grouper.add({1, 10, 3});
    grouper.finish();
    grouper.finish();
    EXPECT_EQ(profiles_.size(), 1);
}

TEST_F(UserGrouperTest, NullSinkRejected) {
    EXPECT_THROW(UserGrouper(GroupingMode::BUFFERED, nullptr),
                 std::invalid_argument);
}

TEST_F(UserGrouperTest, EmptyInputEmitsNothing) {
    auto grouper = makeGrouper(GroupingMode::CONTIGUOUS);
    grouper.finish();
    EXPECT_TRUE(profiles_.empty());
    EXPECT_EQ(grouper.usersEmitted(), 0);
}

TEST(GroupingModeTest, StringConversion) {
    EXPECT_EQ(groupingModeToString(GroupingMode::BUFFERED), "buffered");
    EXPECT_EQ(groupingModeToString(GroupingMode::CONTIGUOUS), "contiguous");
    EXPECT_EQ(groupingModeFromString("contiguous"), GroupingMode::CONTIGUOUS);
    EXPECT_EQ(groupingModeFromString("buffered"), GroupingMode::BUFFERED);
    EXPECT_FALSE(groupingModeFromString("sorted").has_value());
}
