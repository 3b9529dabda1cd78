// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * ItemSim - Item-item similarity engine
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#ifndef ITEMSIM_SIMILARITY_TYPES_HPP
#define ITEMSIM_SIMILARITY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace itemsim::similarity {

using UserId = std::int32_t;
using ItemId = std::int32_t;
using RatingValue = std::int32_t;
using SupportCount = std::uint64_t;

/**
 * @brief A single (user, item, rating) record handed over by ingestion
 */
struct Rating {
    UserId userId = 0;
    ItemId itemId = 0;
    RatingValue value = 0;

    [[nodiscard]] bool operator==(const Rating&) const = default;
};

/**
 * @brief One entry of a user's rating list
 */
struct ItemRating {
    ItemId itemId = 0;
    RatingValue value = 0;

    [[nodiscard]] bool operator==(const ItemRating&) const = default;
};

/**
 * @brief All post-filter ratings of one user
 *
 * itemId is unique within a profile. Profiles emitted by UserGrouper are
 * sorted by itemId.
 */
struct UserProfile {
    UserId userId = 0;
    std::vector<ItemRating> ratings;
};

/**
 * @brief Canonically ordered key of an unordered item pair (itemA < itemB)
 */
struct PairKey {
    ItemId itemA = 0;
    ItemId itemB = 0;

    /**
     * @brief Build a key from two distinct items in any order
     */
    [[nodiscard]] static constexpr auto of(ItemId first, ItemId second) noexcept
        -> PairKey {
        return first < second ? PairKey{first, second} : PairKey{second, first};
    }

    [[nodiscard]] constexpr bool contains(ItemId item) const noexcept {
        return itemA == item || itemB == item;
    }

    /**
     * @brief The member of the pair that is not @p item
     */
    [[nodiscard]] constexpr auto other(ItemId item) const noexcept -> ItemId {
        return itemA == item ? itemB : itemA;
    }

    [[nodiscard]] bool operator==(const PairKey&) const = default;
    [[nodiscard]] constexpr bool operator<(const PairKey& rhs) const noexcept {
        return itemA != rhs.itemA ? itemA < rhs.itemA : itemB < rhs.itemB;
    }
};

struct PairKeyHash {
    [[nodiscard]] auto operator()(const PairKey& key) const noexcept
        -> std::size_t {
        auto packed = (static_cast<std::uint64_t>(
                           static_cast<std::uint32_t>(key.itemA))
                       << 32) |
                      static_cast<std::uint32_t>(key.itemB);
        return std::hash<std::uint64_t>{}(packed);
    }
};

/**
 * @brief One user's contribution to one item pair
 */
struct PairContribution {
    ItemId itemA = 0;
    ItemId itemB = 0;
    RatingValue valueA = 0;
    RatingValue valueB = 0;

    [[nodiscard]] constexpr auto key() const noexcept -> PairKey {
        return PairKey{itemA, itemB};
    }

    [[nodiscard]] bool operator==(const PairContribution&) const = default;
};

/**
 * @brief Similarity score of a finalized item pair
 */
struct ScoredPair {
    ItemId itemA = 0;
    ItemId itemB = 0;
    double score = 0.0;
    SupportCount supportCount = 0;

    [[nodiscard]] constexpr auto key() const noexcept -> PairKey {
        return PairKey{itemA, itemB};
    }

    [[nodiscard]] bool operator==(const ScoredPair&) const = default;
};

/**
 * @brief A recommended item relative to a query target
 */
struct Recommendation {
    ItemId itemId = 0;
    double score = 0.0;
    SupportCount supportCount = 0;

    [[nodiscard]] bool operator==(const Recommendation&) const = default;
};

/**
 * @brief The two top-N views returned for a target item
 */
struct RecommendationResult {
    std::vector<Recommendation> byScore;    ///< Sorted by score descending
    std::vector<Recommendation> bySupport;  ///< Sorted by support descending

    [[nodiscard]] bool empty() const noexcept {
        return byScore.empty() && bySupport.empty();
    }
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_TYPES_HPP
