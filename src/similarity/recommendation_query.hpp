#ifndef ITEMSIM_SIMILARITY_RECOMMENDATION_QUERY_HPP
#define ITEMSIM_SIMILARITY_RECOMMENDATION_QUERY_HPP

#include <span>
#include <vector>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Thresholds and size of a similar-item query
 */
struct QueryOptions {
    double scoreThreshold = 0.97;  ///< Keep pairs with score strictly above
    SupportCount minSupport = 50;  ///< Keep pairs with support strictly above
    int topN = 10;                 ///< Length limit of each view
};

/**
 * @brief Stateless top-N query over finalized scored pairs
 *
 * Both views are sorted descending on their key; ties go to the lower
 * item id so results are reproducible. An unknown target or thresholds
 * that exclude everything give empty views.
 */
class RecommendationQuery {
public:
    /**
     * @brief Whether @p pair involves @p target and passes both thresholds
     */
    [[nodiscard]] static bool qualifies(const ScoredPair& pair, ItemId target,
                                        const QueryOptions& options) noexcept;

    /**
     * @brief Run the query over every scored pair
     */
    [[nodiscard]] static auto run(std::span<const ScoredPair> pairs,
                                  ItemId target, const QueryOptions& options)
        -> RecommendationResult;

    /**
     * @brief Build both top-N views from already qualified candidates
     */
    [[nodiscard]] static auto rank(std::vector<Recommendation> candidates,
                                   int topN) -> RecommendationResult;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_RECOMMENDATION_QUERY_HPP
