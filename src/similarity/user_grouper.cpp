#include "user_grouper.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace itemsim::similarity {

auto groupingModeToString(GroupingMode mode) -> std::string_view {
    switch (mode) {
        case GroupingMode::BUFFERED:
            return "buffered";
        case GroupingMode::CONTIGUOUS:
            return "contiguous";
    }
    return "buffered";
}

auto groupingModeFromString(std::string_view name)
    -> std::optional<GroupingMode> {
    if (name == "buffered") {
        return GroupingMode::BUFFERED;
    }
    if (name == "contiguous") {
        return GroupingMode::CONTIGUOUS;
    }
    return std::nullopt;
}

UserGrouper::UserGrouper(GroupingMode mode, ProfileSink sink)
    : mode_(mode), sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("UserGrouper requires a profile sink");
    }
}

void UserGrouper::insert(PartialProfile& profile, const Rating& rating) {
    auto [it, inserted] = profile.try_emplace(rating.itemId, rating.value);
    if (!inserted) {
        spdlog::debug("Duplicate rating for user {} item {}: {} replaces {}",
                      rating.userId, rating.itemId, rating.value, it->second);
        it->second = rating.value;
        ++duplicatesReplaced_;
    }
}

void UserGrouper::emit(UserId userId, PartialProfile&& profile) {
    UserProfile out;
    out.userId = userId;
    out.ratings.reserve(profile.size());
    for (const auto& [itemId, value] : profile) {
        out.ratings.push_back({itemId, value});
    }
    std::sort(out.ratings.begin(), out.ratings.end(),
              [](const ItemRating& a, const ItemRating& b) {
                  return a.itemId < b.itemId;
              });
    profile.clear();

    ++usersEmitted_;
    sink_(std::move(out));
}

void UserGrouper::add(const Rating& rating) {
    if (finished_) {
        throw std::logic_error("UserGrouper::add called after finish()");
    }

    if (mode_ == GroupingMode::BUFFERED) {
        insert(pending_[rating.userId], rating);
        return;
    }

    if (currentUser_ && *currentUser_ == rating.userId) {
        insert(current_, rating);
        return;
    }

    if (closedUsers_.contains(rating.userId)) {
        throw MalformedInputException(
            "Ratings of user " + std::to_string(rating.userId) +
            " are not contiguous; use buffered grouping for unsorted input");
    }

    if (currentUser_) {
        closedUsers_.insert(*currentUser_);
        emit(*currentUser_, std::move(current_));
    }
    currentUser_ = rating.userId;
    insert(current_, rating);
}

void UserGrouper::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;

    if (mode_ == GroupingMode::CONTIGUOUS) {
        if (currentUser_) {
            closedUsers_.insert(*currentUser_);
            emit(*currentUser_, std::move(current_));
            currentUser_.reset();
        }
        return;
    }

    std::vector<UserId> users;
    users.reserve(pending_.size());
    for (const auto& [userId, _] : pending_) {
        users.push_back(userId);
    }
    std::sort(users.begin(), users.end());

    spdlog::debug("Emitting {} buffered user profiles", users.size());
    for (auto userId : users) {
        auto node = pending_.extract(userId);
        emit(userId, std::move(node.mapped()));
    }
}

}  // namespace itemsim::similarity
