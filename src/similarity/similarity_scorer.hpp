#ifndef ITEMSIM_SIMILARITY_SIMILARITY_SCORER_HPP
#define ITEMSIM_SIMILARITY_SIMILARITY_SCORER_HPP

#include <vector>

#include "pair_aggregator.hpp"
#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Cosine similarity of a finalized pair aggregate
 *
 * Returns 0 when either side has a zero sum of squares. Never throws.
 */
[[nodiscard]] auto cosineScore(const PairAggregate& aggregate) noexcept
    -> double;

/**
 * @brief Score one finalized pair
 */
[[nodiscard]] auto scorePair(const PairKey& key,
                             const PairAggregate& aggregate) noexcept
    -> ScoredPair;

/**
 * @brief Score a whole finalized table
 * @return Scored pairs ordered by (itemA, itemB)
 */
[[nodiscard]] auto scoreAll(const PairAggregateTable& table)
    -> std::vector<ScoredPair>;

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_SIMILARITY_SCORER_HPP
