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

#ifndef ITEMSIM_SIMILARITY_SIMILARITY_MODEL_HPP
#define ITEMSIM_SIMILARITY_SIMILARITY_MODEL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "recommendation_query.hpp"
#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Frozen set of scored item pairs
 *
 * Built once after aggregation and never modified, so any number of
 * threads may query it without synchronization. An item -> pair index
 * keeps per-target queries proportional to that item's neighbourhood.
 */
class SimilarityModel {
public:
    SimilarityModel() = default;

    /**
     * @brief Take ownership of scored pairs and build the item index
     * @param pairs Scored pairs, each key at most once
     */
    explicit SimilarityModel(std::vector<ScoredPair> pairs);

    /**
     * @brief Top-N recommendations for @p target
     *
     * Same result as RecommendationQuery::run over pairs(), restricted to
     * the pairs that involve the target.
     */
    [[nodiscard]] auto recommend(ItemId target,
                                 const QueryOptions& options) const
        -> RecommendationResult;

    /**
     * @brief Scored pair of two items, in either order
     */
    [[nodiscard]] auto find(ItemId first, ItemId second) const
        -> std::optional<ScoredPair>;

    /**
     * @brief Whether @p item appears in at least one pair
     */
    [[nodiscard]] bool containsItem(ItemId item) const;

    /// All pairs, ordered by (itemA, itemB)
    [[nodiscard]] auto pairs() const noexcept -> std::span<const ScoredPair> {
        return pairs_;
    }

    [[nodiscard]] auto pairCount() const noexcept -> std::size_t {
        return pairs_.size();
    }

    [[nodiscard]] auto itemCount() const noexcept -> std::size_t {
        return itemIndex_.size();
    }

    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }

private:
    std::vector<ScoredPair> pairs_;
    std::unordered_map<ItemId, std::vector<std::uint32_t>> itemIndex_;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_SIMILARITY_MODEL_HPP
