// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file similarity.hpp
 * @brief Aggregated header for the item similarity module.
 *
 * Include this file to get the whole pipeline: rating filtering, user
 * grouping, pair expansion and aggregation, cosine scoring and top-N
 * queries.
 *
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2024 Max Qian
 */

#pragma once

// ============================================================================
// Pipeline Components
// ============================================================================

#include "exception.hpp"
#include "pair_aggregator.hpp"
#include "pair_expander.hpp"
#include "rating_filter.hpp"
#include "rating_source.hpp"
#include "recommendation_query.hpp"
#include "similarity_engine.hpp"
#include "similarity_model.hpp"
#include "similarity_pipeline.hpp"
#include "similarity_scorer.hpp"
#include "types.hpp"
#include "user_grouper.hpp"

namespace itemsim::similarity {

/**
 * @brief Similarity module version.
 */
inline constexpr const char* SIMILARITY_MODULE_VERSION = "1.0.0";

/**
 * @brief Get similarity module version string.
 * @return Version string.
 */
[[nodiscard]] inline const char* getSimilarityModuleVersion() noexcept {
    return SIMILARITY_MODULE_VERSION;
}

}  // namespace itemsim::similarity
