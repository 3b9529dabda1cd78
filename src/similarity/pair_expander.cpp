#include "pair_expander.hpp"

#include <algorithm>
#include <span>
#include <string>

#include "exception.hpp"

namespace itemsim::similarity {

namespace {

auto byItem(const ItemRating& a, const ItemRating& b) -> bool {
    return a.itemId < b.itemId;
}

void rejectDuplicates(const UserProfile& profile,
                      std::span<const ItemRating> sorted) {
    auto dup = std::adjacent_find(
        sorted.begin(), sorted.end(),
        [](const ItemRating& a, const ItemRating& b) {
            return a.itemId == b.itemId;
        });
    if (dup != sorted.end()) {
        throw MalformedInputException(
            "Profile of user " + std::to_string(profile.userId) +
            " rates item " + std::to_string(dup->itemId) + " more than once");
    }
}

}  // namespace

auto PairExpander::expand(const UserProfile& profile,
                          const ContributionSink& sink) -> std::uint64_t {
    std::span<const ItemRating> ratings = profile.ratings;
    if (ratings.size() < 2) {
        return 0;
    }

    // Grouper output is already sorted; anything else gets a sorted copy.
    std::vector<ItemRating> sortedCopy;
    if (!std::is_sorted(ratings.begin(), ratings.end(), byItem)) {
        sortedCopy.assign(ratings.begin(), ratings.end());
        std::sort(sortedCopy.begin(), sortedCopy.end(), byItem);
        ratings = sortedCopy;
    }
    rejectDuplicates(profile, ratings);

    std::uint64_t emitted = 0;
    for (std::size_t i = 0; i + 1 < ratings.size(); ++i) {
        const auto& lower = ratings[i];
        for (std::size_t j = i + 1; j < ratings.size(); ++j) {
            const auto& upper = ratings[j];
            sink(PairContribution{lower.itemId, upper.itemId, lower.value,
                                  upper.value});
            ++emitted;
        }
    }
    return emitted;
}

auto PairExpander::expandAll(const UserProfile& profile)
    -> std::vector<PairContribution> {
    std::vector<PairContribution> out;
    out.reserve(static_cast<std::size_t>(pairCount(profile.ratings.size())));
    expand(profile,
           [&out](const PairContribution& pair) { out.push_back(pair); });
    return out;
}

}  // namespace itemsim::similarity
