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

#include "similarity_pipeline.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include "exception.hpp"
#include "pair_aggregator.hpp"
#include "pair_expander.hpp"
#include "similarity_scorer.hpp"

namespace itemsim::similarity {

namespace {

/**
 * @brief Fans batches of profiles out to shard tasks and merges them back
 *
 * At most maxInFlight shard tasks run at once; the oldest one is merged
 * into the result before another is started.
 */
class ShardScheduler {
public:
    ShardScheduler(std::size_t workers, std::size_t batchSize)
        : workers_(workers), batchSize_(std::max<std::size_t>(batchSize, 1)) {
        batch_.reserve(batchSize_);
    }

    void submit(UserProfile&& profile) {
        if (workers_ <= 1) {
            result_.absorbProfile(profile);
            return;
        }
        batch_.push_back(std::move(profile));
        if (batch_.size() >= batchSize_) {
            dispatch();
        }
    }

    [[nodiscard]] auto finish() -> PairAggregator {
        if (!batch_.empty()) {
            dispatch();
        }
        while (!inFlight_.empty()) {
            mergeOldest();
        }
        return std::move(result_);
    }

    [[nodiscard]] auto shardsMerged() const noexcept -> std::uint64_t {
        return shardsMerged_;
    }

private:
    void dispatch() {
        if (inFlight_.size() >= workers_) {
            mergeOldest();
        }
        inFlight_.push_back(std::async(
            std::launch::async, [batch = std::move(batch_)]() {
                PairAggregator shard;
                for (const auto& profile : batch) {
                    shard.absorbProfile(profile);
                }
                return shard;
            }));
        batch_ = {};
        batch_.reserve(batchSize_);
    }

    void mergeOldest() {
        // get() rethrows an overflow raised inside the shard task
        auto shard = inFlight_.front().get();
        inFlight_.pop_front();
        spdlog::debug("Merging shard with {} pairs", shard.pairCount());
        result_.merge(std::move(shard));
        ++shardsMerged_;
    }

    std::size_t workers_;
    std::size_t batchSize_;
    std::vector<UserProfile> batch_;
    std::deque<std::future<PairAggregator>> inFlight_;
    PairAggregator result_;
    std::uint64_t shardsMerged_ = 0;
};

}  // namespace

auto PipelineStats::toString() const -> std::string {
    std::stringstream ss;
    ss << "Similarity Pipeline Statistics:\n"
       << "  Ratings Read: " << ratingsRead << "\n"
       << "  Ratings Kept: " << ratingsKept << "\n"
       << "  Duplicates Replaced: " << duplicatesReplaced << "\n"
       << "  Users: " << users << "\n"
       << "  Pair Contributions: " << contributions << "\n"
       << "  Item Pairs: " << pairs << "\n"
       << "  Shards: " << shards << "\n"
       << "  Workers: " << workers;
    return ss.str();
}

SimilarityPipeline::SimilarityPipeline() : SimilarityPipeline(Options{}) {}

SimilarityPipeline::SimilarityPipeline(const Options& options)
    : options_(options) {
    spdlog::debug(
        "SimilarityPipeline configured: minRating={}, workers={}, "
        "batchSize={}, grouping={}",
        options_.minRating, options_.workerCount, options_.batchSize,
        groupingModeToString(options_.groupingMode));
}

auto SimilarityPipeline::effectiveWorkers(std::size_t requested) noexcept
    -> std::size_t {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
}

auto SimilarityPipeline::run(IRatingSource& source) -> SimilarityModel {
    spdlog::stopwatch sw;
    PipelineStats stats;
    stats.workers = effectiveWorkers(options_.workerCount);

    RatingFilter filter(options_.minRating);
    ShardScheduler scheduler(stats.workers, options_.batchSize);

    std::uint64_t expectedContributions = 0;
    UserGrouper grouper(options_.groupingMode, [&](UserProfile&& profile) {
        expectedContributions +=
            PairExpander::pairCount(profile.ratings.size());
        scheduler.submit(std::move(profile));
    });

    while (auto rating = source.next()) {
        ++stats.ratingsRead;
        if (!filter.accepts(*rating)) {
            continue;
        }
        ++stats.ratingsKept;
        grouper.add(*rating);
    }
    grouper.finish();

    spdlog::debug("Grouped {} of {} ratings into {} user profiles",
                  stats.ratingsKept, stats.ratingsRead,
                  grouper.usersEmitted());

    auto aggregator = scheduler.finish();
    if (aggregator.contributionCount() != expectedContributions) {
        spdlog::error("Absorbed {} pair contributions, expected {}",
                      aggregator.contributionCount(), expectedContributions);
        throw SimilarityException(
            "Pair contribution count does not match user fan-out");
    }

    stats.duplicatesReplaced = grouper.duplicatesReplaced();
    stats.users = grouper.usersEmitted();
    stats.contributions = aggregator.contributionCount();
    stats.pairs = aggregator.pairCount();
    stats.shards = scheduler.shardsMerged();

    auto table = aggregator.finalize();
    SimilarityModel model(scoreAll(table));

    stats_ = stats;
    spdlog::info(
        "Similarity model built in {:.3f}s: {} users, {} pairs over {} items",
        sw.elapsed().count(), stats_.users, stats_.pairs, model.itemCount());
    return model;
}

}  // namespace itemsim::similarity
