#include "similarity_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace itemsim::similarity {

auto cosineScore(const PairAggregate& aggregate) noexcept -> double {
    double denominator =
        std::sqrt(aggregate.sumSqA) * std::sqrt(aggregate.sumSqB);
    if (denominator == 0.0) {
        return 0.0;
    }
    // Identical vectors can round a few ulps past 1.
    return std::min(aggregate.sumProduct / denominator, 1.0);
}

auto scorePair(const PairKey& key, const PairAggregate& aggregate) noexcept
    -> ScoredPair {
    return ScoredPair{key.itemA, key.itemB, cosineScore(aggregate),
                      aggregate.supportCount};
}

auto scoreAll(const PairAggregateTable& table) -> std::vector<ScoredPair> {
    std::vector<ScoredPair> scored;
    scored.reserve(table.size());
    for (const auto& [key, aggregate] : table) {
        scored.push_back(scorePair(key, aggregate));
    }
    std::sort(scored.begin(), scored.end(),
              [](const ScoredPair& a, const ScoredPair& b) {
                  return a.key() < b.key();
              });
    return scored;
}

}  // namespace itemsim::similarity
