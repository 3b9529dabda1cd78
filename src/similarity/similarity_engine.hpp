#ifndef ITEMSIM_SIMILARITY_SIMILARITY_ENGINE_HPP
#define ITEMSIM_SIMILARITY_SIMILARITY_ENGINE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "similarity_model.hpp"
#include "similarity_pipeline.hpp"

namespace itemsim::similarity {

/**
 * @brief Item-item similarity engine
 *
 * Owns the pipeline configuration and the most recently built model.
 * Building replaces the model atomically; queries keep working on the
 * model they started with, so build() and recommend() may run on
 * different threads.
 */
class ItemSimilarityEngine {
public:
    using Config = SimilarityPipeline::Options;

    /**
     * @brief Construct with default configuration
     */
    ItemSimilarityEngine();

    /**
     * @brief Construct with custom configuration
     * @param config Pipeline options
     */
    explicit ItemSimilarityEngine(const Config& config);

    ~ItemSimilarityEngine() = default;

    ItemSimilarityEngine(const ItemSimilarityEngine&) = delete;
    ItemSimilarityEngine& operator=(const ItemSimilarityEngine&) = delete;

    /**
     * @brief Run the full pipeline over @p source and install the result
     *
     * On failure the previous model stays installed.
     *
     * @throws MalformedInputException
     * @throws AggregationOverflowException
     */
    void build(IRatingSource& source);

    /**
     * @brief Convenience overload over in-memory ratings
     */
    void build(std::vector<Rating> ratings);

    /**
     * @brief Top-N similar items for @p target by score and by support
     *
     * Returns empty views when no model has been built or the target is
     * unknown.
     */
    [[nodiscard]] auto recommend(ItemId target,
                                 const QueryOptions& options = {}) const
        -> RecommendationResult;

    /**
     * @brief Current model, or nullptr before the first build
     */
    [[nodiscard]] auto model() const -> std::shared_ptr<const SimilarityModel>;

    [[nodiscard]] bool isBuilt() const;

    /**
     * @brief Counters of the last successful build
     */
    [[nodiscard]] auto lastStats() const -> std::optional<PipelineStats>;

    /**
     * @brief Human readable summary of configuration and model
     */
    [[nodiscard]] auto getStats() const -> std::string;

    /**
     * @brief Drop the current model
     */
    void clear();

    [[nodiscard]] auto config() const noexcept -> const Config& {
        return config_;
    }

private:
    Config config_;
    std::shared_ptr<const SimilarityModel> model_;
    std::optional<PipelineStats> stats_;
    mutable std::mutex mtx_;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_SIMILARITY_ENGINE_HPP
