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

#ifndef ITEMSIM_SIMILARITY_SIMILARITY_PIPELINE_HPP
#define ITEMSIM_SIMILARITY_SIMILARITY_PIPELINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "rating_filter.hpp"
#include "rating_source.hpp"
#include "similarity_model.hpp"
#include "user_grouper.hpp"

namespace itemsim::similarity {

/**
 * @brief Counters collected during one pipeline run
 */
struct PipelineStats {
    std::uint64_t ratingsRead = 0;         ///< Records pulled from the source
    std::uint64_t ratingsKept = 0;         ///< Records passing RatingFilter
    std::uint64_t duplicatesReplaced = 0;  ///< Last-write-wins replacements
    std::uint64_t users = 0;               ///< Profiles emitted by grouping
    std::uint64_t contributions = 0;       ///< Pair contributions absorbed
    std::uint64_t pairs = 0;               ///< Distinct item pairs
    std::uint64_t shards = 0;              ///< Aggregator shards merged
    std::size_t workers = 0;               ///< Worker count actually used

    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * @brief Map-reduce driver from raw ratings to a frozen SimilarityModel
 *
 * Map side: RatingFilter -> UserGrouper -> PairExpander. Reduce side:
 * batches of user profiles are aggregated into private PairAggregator
 * shards, with up to workerCount shards being built concurrently through
 * std::async. Only the calling thread merges shards, so no lock is ever
 * held over the pair table. With a single worker profiles are absorbed
 * inline.
 *
 * A MalformedInputException or AggregationOverflowException aborts the
 * run; partial state is discarded.
 */
class SimilarityPipeline {
public:
    struct Options {
        RatingValue minRating = RatingFilter::DEFAULT_MIN_RATING;
        std::size_t workerCount = 0;  ///< 0 selects hardware concurrency
        std::size_t batchSize = 256;  ///< Users per shard task
        GroupingMode groupingMode = GroupingMode::BUFFERED;
    };

    SimilarityPipeline();
    explicit SimilarityPipeline(const Options& options);

    /**
     * @brief Consume @p source completely and build the model
     * @throws MalformedInputException
     * @throws AggregationOverflowException
     */
    [[nodiscard]] auto run(IRatingSource& source) -> SimilarityModel;

    /// Counters of the most recent successful run
    [[nodiscard]] auto lastStats() const noexcept -> const PipelineStats& {
        return stats_;
    }

    [[nodiscard]] auto options() const noexcept -> const Options& {
        return options_;
    }

    /**
     * @brief Resolve workerCount == 0 to the number of hardware threads
     */
    [[nodiscard]] static auto effectiveWorkers(std::size_t requested) noexcept
        -> std::size_t;

private:
    Options options_;
    PipelineStats stats_;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_SIMILARITY_PIPELINE_HPP
