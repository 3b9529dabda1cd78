/*
 * similarity_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Similarity pipeline configuration section

**************************************************/

#ifndef ITEMSIM_CONFIG_SECTIONS_SIMILARITY_CONFIG_HPP
#define ITEMSIM_CONFIG_SECTIONS_SIMILARITY_CONFIG_HPP

#include <cstddef>
#include <string>

#include "../config_section.hpp"
#include "similarity/similarity_pipeline.hpp"

namespace itemsim::config {

/**
 * @brief Aggregation pipeline configuration
 *
 * @example
 * ```json
 * {
 *   "itemsim": {
 *     "similarity": {
 *       "minRating": 3,
 *       "workerCount": 0,
 *       "batchSize": 256,
 *       "groupingMode": "buffered"
 *     }
 *   }
 * }
 * ```
 */
struct SimilarityConfig : ConfigSection<SimilarityConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/itemsim/similarity";

    int minRating{3};                     ///< Inclusive rating threshold
    int workerCount{0};                   ///< Aggregation workers, 0 = auto
    int batchSize{256};                   ///< Users per shard task
    std::string groupingMode{"buffered"};  ///< "buffered" or "contiguous"

    [[nodiscard]] json serialize() const {
        return {{"minRating", minRating},
                {"workerCount", workerCount},
                {"batchSize", batchSize},
                {"groupingMode", groupingMode}};
    }

    [[nodiscard]] static SimilarityConfig deserialize(const json& j) {
        SimilarityConfig cfg;
        cfg.minRating = j.value("minRating", cfg.minRating);
        cfg.workerCount = j.value("workerCount", cfg.workerCount);
        cfg.batchSize = j.value("batchSize", cfg.batchSize);
        cfg.groupingMode = j.value("groupingMode", cfg.groupingMode);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"minRating", {{"type", "integer"}, {"default", 3}}},
                {"workerCount", {
                    {"type", "integer"},
                    {"minimum", 0},
                    {"default", 0}
                }},
                {"batchSize", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"default", 256}
                }},
                {"groupingMode", {
                    {"type", "string"},
                    {"enum", {"buffered", "contiguous"}},
                    {"default", "buffered"}
                }}
            }}
        };
    }

    void checkValues(ConfigValidationResult& result) const {
        if (workerCount < 0) {
            result.addError(keyPath("workerCount"), "must be >= 0");
        }
        if (batchSize < 1) {
            result.addError(keyPath("batchSize"), "must be >= 1");
        }
        if (!similarity::groupingModeFromString(groupingMode)) {
            result.addError(keyPath("groupingMode"),
                            "unknown grouping mode '" + groupingMode + "'");
        }
    }

    /**
     * @brief Pipeline options described by this section
     *
     * Call only on a validated configuration.
     */
    [[nodiscard]] similarity::SimilarityPipeline::Options toOptions() const {
        similarity::SimilarityPipeline::Options options;
        options.minRating = minRating;
        options.workerCount = static_cast<std::size_t>(workerCount);
        options.batchSize = static_cast<std::size_t>(batchSize);
        options.groupingMode =
            similarity::groupingModeFromString(groupingMode)
                .value_or(similarity::GroupingMode::BUFFERED);
        return options;
    }
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_SECTIONS_SIMILARITY_CONFIG_HPP
