#include "rating_filter.hpp"

#include <algorithm>
#include <iterator>

namespace itemsim::similarity {

auto RatingFilter::apply(std::span<const Rating> ratings) const
    -> std::vector<Rating> {
    std::vector<Rating> kept;
    kept.reserve(ratings.size());
    std::copy_if(ratings.begin(), ratings.end(), std::back_inserter(kept),
                 [this](const Rating& rating) { return accepts(rating); });
    return kept;
}

}  // namespace itemsim::similarity
