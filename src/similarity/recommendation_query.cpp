#include "recommendation_query.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace itemsim::similarity {

namespace {

auto topNBy(std::vector<Recommendation> items, std::size_t limit,
            bool (*before)(const Recommendation&, const Recommendation&))
    -> std::vector<Recommendation> {
    if (items.size() > limit) {
        std::partial_sort(items.begin(),
                          items.begin() + static_cast<std::ptrdiff_t>(limit),
                          items.end(), before);
        items.resize(limit);
    } else {
        std::sort(items.begin(), items.end(), before);
    }
    return items;
}

bool higherScore(const Recommendation& a, const Recommendation& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.itemId < b.itemId;
}

bool higherSupport(const Recommendation& a, const Recommendation& b) {
    if (a.supportCount != b.supportCount) {
        return a.supportCount > b.supportCount;
    }
    return a.itemId < b.itemId;
}

}  // namespace

bool RecommendationQuery::qualifies(const ScoredPair& pair, ItemId target,
                                    const QueryOptions& options) noexcept {
    return pair.key().contains(target) &&
           pair.score > options.scoreThreshold &&
           pair.supportCount > options.minSupport;
}

auto RecommendationQuery::run(std::span<const ScoredPair> pairs, ItemId target,
                              const QueryOptions& options)
    -> RecommendationResult {
    std::vector<Recommendation> candidates;
    for (const auto& pair : pairs) {
        if (qualifies(pair, target, options)) {
            candidates.push_back(
                {pair.key().other(target), pair.score, pair.supportCount});
        }
    }
    return rank(std::move(candidates), options.topN);
}

auto RecommendationQuery::rank(std::vector<Recommendation> candidates,
                               int topN) -> RecommendationResult {
    if (topN <= 0 || candidates.empty()) {
        return {};
    }
    auto limit = static_cast<std::size_t>(topN);

    RecommendationResult result;
    result.bySupport = topNBy(candidates, limit, higherSupport);
    result.byScore = topNBy(std::move(candidates), limit, higherScore);
    return result;
}

}  // namespace itemsim::similarity
