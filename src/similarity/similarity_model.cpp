#include "similarity_model.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace itemsim::similarity {

SimilarityModel::SimilarityModel(std::vector<ScoredPair> pairs)
    : pairs_(std::move(pairs)) {
    if (pairs_.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("Too many pairs for SimilarityModel index");
    }

    std::sort(pairs_.begin(), pairs_.end(),
              [](const ScoredPair& a, const ScoredPair& b) {
                  return a.key() < b.key();
              });

    for (std::uint32_t i = 0; i < pairs_.size(); ++i) {
        itemIndex_[pairs_[i].itemA].push_back(i);
        itemIndex_[pairs_[i].itemB].push_back(i);
    }
}

auto SimilarityModel::recommend(ItemId target,
                                const QueryOptions& options) const
    -> RecommendationResult {
    auto it = itemIndex_.find(target);
    if (it == itemIndex_.end()) {
        return {};
    }

    std::vector<Recommendation> candidates;
    for (auto index : it->second) {
        const auto& pair = pairs_[index];
        if (RecommendationQuery::qualifies(pair, target, options)) {
            candidates.push_back(
                {pair.key().other(target), pair.score, pair.supportCount});
        }
    }
    return RecommendationQuery::rank(std::move(candidates), options.topN);
}

auto SimilarityModel::find(ItemId first, ItemId second) const
    -> std::optional<ScoredPair> {
    if (first == second) {
        return std::nullopt;
    }
    auto key = PairKey::of(first, second);
    auto it = std::lower_bound(pairs_.begin(), pairs_.end(), key,
                               [](const ScoredPair& pair, const PairKey& k) {
                                   return pair.key() < k;
                               });
    if (it == pairs_.end() || !(it->key() == key)) {
        return std::nullopt;
    }
    return *it;
}

bool SimilarityModel::containsItem(ItemId item) const {
    return itemIndex_.contains(item);
}

}  // namespace itemsim::similarity
