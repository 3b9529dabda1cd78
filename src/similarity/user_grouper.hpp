#ifndef ITEMSIM_SIMILARITY_USER_GROUPER_HPP
#define ITEMSIM_SIMILARITY_USER_GROUPER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief How UserGrouper holds partial profiles
 */
enum class GroupingMode {
    BUFFERED,    ///< Accumulate every user, emit all profiles on finish()
    CONTIGUOUS,  ///< Input is ordered by user, keep one profile resident
};

[[nodiscard]] auto groupingModeToString(GroupingMode mode) -> std::string_view;

/**
 * @brief Parse "buffered" / "contiguous"
 * @return std::nullopt for unknown names
 */
[[nodiscard]] auto groupingModeFromString(std::string_view name)
    -> std::optional<GroupingMode>;

/**
 * @brief Partitions filtered ratings into per-user profiles
 *
 * A later rating for the same (user, item) replaces the earlier one.
 * Profiles are handed to the sink with ratings sorted by itemId.
 *
 * In CONTIGUOUS mode a profile is emitted as soon as the user id changes;
 * a user showing up again after its block ended throws
 * MalformedInputException. In BUFFERED mode profiles are emitted on
 * finish() in ascending user id order.
 */
class UserGrouper {
public:
    using ProfileSink = std::function<void(UserProfile&&)>;

    UserGrouper(GroupingMode mode, ProfileSink sink);

    UserGrouper(const UserGrouper&) = delete;
    UserGrouper& operator=(const UserGrouper&) = delete;

    /**
     * @brief Add one filtered rating
     * @throws MalformedInputException on a non-contiguous user (CONTIGUOUS)
     * @throws std::logic_error after finish()
     */
    void add(const Rating& rating);

    /**
     * @brief Flush all pending profiles to the sink
     */
    void finish();

    [[nodiscard]] auto mode() const noexcept -> GroupingMode { return mode_; }

    /// Number of profiles handed to the sink so far
    [[nodiscard]] auto usersEmitted() const noexcept -> std::size_t {
        return usersEmitted_;
    }

    /// Ratings that replaced an earlier rating of the same user and item
    [[nodiscard]] auto duplicatesReplaced() const noexcept -> std::size_t {
        return duplicatesReplaced_;
    }

private:
    // itemId -> value, flattened into a sorted profile on emission
    using PartialProfile = std::unordered_map<ItemId, RatingValue>;

    void insert(PartialProfile& profile, const Rating& rating);
    void emit(UserId userId, PartialProfile&& profile);

    GroupingMode mode_;
    ProfileSink sink_;
    bool finished_ = false;

    std::size_t usersEmitted_ = 0;
    std::size_t duplicatesReplaced_ = 0;

    // BUFFERED
    std::unordered_map<UserId, PartialProfile> pending_;

    // CONTIGUOUS
    std::optional<UserId> currentUser_;
    PartialProfile current_;
    std::unordered_set<UserId> closedUsers_;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_USER_GROUPER_HPP
