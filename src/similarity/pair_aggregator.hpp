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

#ifndef ITEMSIM_SIMILARITY_PAIR_AGGREGATOR_HPP
#define ITEMSIM_SIMILARITY_PAIR_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Running sums of one item pair
 *
 * Every rating product is an integer, so the sums stay exact as long as
 * their magnitude is below 2^53. Leaving that range, or saturating the
 * support counter, throws AggregationOverflowException instead of
 * silently losing precision.
 */
struct PairAggregate {
    /// Largest magnitude a double accumulator may reach and stay exact
    static constexpr double EXACT_LIMIT = 9007199254740992.0;  // 2^53

    double sumProduct = 0.0;
    double sumSqA = 0.0;
    double sumSqB = 0.0;
    SupportCount supportCount = 0;

    /**
     * @brief Fold one user's contribution into the sums
     * @throws AggregationOverflowException
     */
    void absorb(const PairContribution& contribution);

    /**
     * @brief Fold another partial aggregate of the same pair into this one
     * @throws AggregationOverflowException
     */
    void merge(const PairAggregate& other);

    [[nodiscard]] bool operator==(const PairAggregate&) const = default;
};

/**
 * @brief Associative, commutative combine of two partial aggregates
 * @throws AggregationOverflowException
 */
[[nodiscard]] auto combine(PairAggregate lhs, const PairAggregate& rhs)
    -> PairAggregate;

using PairAggregateTable =
    std::unordered_map<PairKey, PairAggregate, PairKeyHash>;

/**
 * @brief Reduces pair contributions into per-pair aggregates
 *
 * An aggregator is single-writer. Parallel builds give each worker its own
 * aggregator (a shard) and merge the shards at the end; the combine is
 * order independent so the result does not depend on the partitioning.
 *
 * After finalize() the aggregator is drained and refuses further input.
 */
class PairAggregator {
public:
    PairAggregator() = default;

    PairAggregator(const PairAggregator&) = delete;
    PairAggregator& operator=(const PairAggregator&) = delete;
    PairAggregator(PairAggregator&&) noexcept = default;
    PairAggregator& operator=(PairAggregator&&) noexcept = default;

    /**
     * @brief Absorb a single contribution
     * @throws std::invalid_argument if itemA >= itemB
     * @throws AggregationOverflowException
     */
    void accumulate(const PairContribution& contribution);

    /**
     * @brief Expand a user profile and absorb all of its pairs
     * @return Number of contributions absorbed, C(k,2)
     */
    auto absorbProfile(const UserProfile& profile) -> std::uint64_t;

    /**
     * @brief Merge a shard built over a disjoint set of users
     *
     * @p other is left empty.
     */
    void merge(PairAggregator&& other);

    /**
     * @brief Hand out the completed table and freeze this aggregator
     */
    [[nodiscard]] auto finalize() -> PairAggregateTable;

    [[nodiscard]] auto pairCount() const noexcept -> std::size_t {
        return table_.size();
    }

    [[nodiscard]] auto contributionCount() const noexcept -> std::uint64_t {
        return contributions_;
    }

    [[nodiscard]] auto usersAbsorbed() const noexcept -> std::uint64_t {
        return users_;
    }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

    /**
     * @brief Current aggregate of a pair, or nullptr if it never received a
     * contribution
     */
    [[nodiscard]] auto find(const PairKey& key) const -> const PairAggregate*;

private:
    void ensureOpen() const;

    PairAggregateTable table_;
    std::uint64_t contributions_ = 0;
    std::uint64_t users_ = 0;
    bool finalized_ = false;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_PAIR_AGGREGATOR_HPP
