#include "similarity_engine.hpp"

#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace itemsim::similarity {

ItemSimilarityEngine::ItemSimilarityEngine()
    : ItemSimilarityEngine(Config{}) {}

ItemSimilarityEngine::ItemSimilarityEngine(const Config& config)
    : config_(config) {
    spdlog::info("ItemSimilarityEngine initialized with {} grouping",
                 groupingModeToString(config_.groupingMode));
}

void ItemSimilarityEngine::build(IRatingSource& source) {
    SimilarityPipeline pipeline(config_);
    auto built =
        std::make_shared<const SimilarityModel>(pipeline.run(source));

    std::lock_guard lock(mtx_);
    model_ = std::move(built);
    stats_ = pipeline.lastStats();
    spdlog::debug("Installed similarity model with {} pairs",
                  model_->pairCount());
}

void ItemSimilarityEngine::build(std::vector<Rating> ratings) {
    VectorRatingSource source(std::move(ratings));
    build(source);
}

auto ItemSimilarityEngine::recommend(ItemId target,
                                     const QueryOptions& options) const
    -> RecommendationResult {
    auto current = model();
    if (!current) {
        spdlog::warn("recommend({}) called before a model was built", target);
        return {};
    }
    if (!current->containsItem(target)) {
        spdlog::debug("Item {} does not appear in any pair", target);
        return {};
    }
    return current->recommend(target, options);
}

auto ItemSimilarityEngine::model() const
    -> std::shared_ptr<const SimilarityModel> {
    std::lock_guard lock(mtx_);
    return model_;
}

bool ItemSimilarityEngine::isBuilt() const {
    std::lock_guard lock(mtx_);
    return model_ != nullptr;
}

auto ItemSimilarityEngine::lastStats() const -> std::optional<PipelineStats> {
    std::lock_guard lock(mtx_);
    return stats_;
}

auto ItemSimilarityEngine::getStats() const -> std::string {
    std::lock_guard lock(mtx_);
    std::stringstream ss;
    ss << "Item Similarity Engine Statistics:\n"
       << "  Min Rating: " << config_.minRating << "\n"
       << "  Workers: "
       << SimilarityPipeline::effectiveWorkers(config_.workerCount) << "\n"
       << "  Grouping: " << groupingModeToString(config_.groupingMode) << "\n"
       << "  Items: " << (model_ ? model_->itemCount() : 0) << "\n"
       << "  Item Pairs: " << (model_ ? model_->pairCount() : 0);
    if (stats_) {
        ss << "\n  Users: " << stats_->users << "\n"
           << "  Ratings Kept: " << stats_->ratingsKept << " of "
           << stats_->ratingsRead;
    }
    return ss.str();
}

void ItemSimilarityEngine::clear() {
    std::lock_guard lock(mtx_);
    model_.reset();
    stats_.reset();
    spdlog::info("All data cleared from ItemSimilarityEngine");
}

}  // namespace itemsim::similarity
