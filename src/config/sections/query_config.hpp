/*
 * query_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Similar-item query configuration section

**************************************************/

#ifndef ITEMSIM_CONFIG_SECTIONS_QUERY_CONFIG_HPP
#define ITEMSIM_CONFIG_SECTIONS_QUERY_CONFIG_HPP

#include <cstdint>

#include "../config_section.hpp"
#include "similarity/recommendation_query.hpp"

namespace itemsim::config {

/**
 * @brief Thresholds for similar-item queries
 */
struct QueryConfig : ConfigSection<QueryConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/itemsim/query";

    double scoreThreshold{0.97};  ///< Keep pairs scoring strictly above
    std::int64_t minSupport{50};  ///< Keep pairs with more shared users
    int topN{10};                 ///< Results per view

    [[nodiscard]] json serialize() const {
        return {{"scoreThreshold", scoreThreshold},
                {"minSupport", minSupport},
                {"topN", topN}};
    }

    [[nodiscard]] static QueryConfig deserialize(const json& j) {
        QueryConfig cfg;
        cfg.scoreThreshold = j.value("scoreThreshold", cfg.scoreThreshold);
        cfg.minSupport = j.value("minSupport", cfg.minSupport);
        cfg.topN = j.value("topN", cfg.topN);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"scoreThreshold", {
                    {"type", "number"},
                    {"minimum", -1.0},
                    {"maximum", 1.0},
                    {"default", 0.97}
                }},
                {"minSupport", {
                    {"type", "integer"},
                    {"minimum", 0},
                    {"default", 50}
                }},
                {"topN", {
                    {"type", "integer"},
                    {"minimum", 0},
                    {"default", 10}
                }}
            }}
        };
    }

    void checkValues(ConfigValidationResult& result) const {
        if (scoreThreshold < -1.0 || scoreThreshold > 1.0) {
            result.addError(keyPath("scoreThreshold"),
                            "must be within [-1, 1]");
        }
        if (minSupport < 0) {
            result.addError(keyPath("minSupport"), "must be >= 0");
        }
        if (topN < 0) {
            result.addError(keyPath("topN"), "must be >= 0");
        }
    }

    /**
     * @brief Query options described by this section
     */
    [[nodiscard]] similarity::QueryOptions toOptions() const {
        similarity::QueryOptions options;
        options.scoreThreshold = scoreThreshold;
        options.minSupport =
            static_cast<similarity::SupportCount>(minSupport < 0 ? 0 : minSupport);
        options.topN = topN;
        return options;
    }
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_SECTIONS_QUERY_CONFIG_HPP
