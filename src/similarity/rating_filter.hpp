#ifndef ITEMSIM_SIMILARITY_RATING_FILTER_HPP
#define ITEMSIM_SIMILARITY_RATING_FILTER_HPP

#include <span>
#include <vector>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Drops low-signal ratings before grouping
 *
 * Keeps a rating when its value is at least the configured threshold.
 */
class RatingFilter {
public:
    static constexpr RatingValue DEFAULT_MIN_RATING = 3;

    explicit RatingFilter(RatingValue minRating = DEFAULT_MIN_RATING) noexcept
        : minRating_(minRating) {}

    [[nodiscard]] bool accepts(const Rating& rating) const noexcept {
        return rating.value >= minRating_;
    }

    /**
     * @brief Copy the accepted subsequence of @p ratings
     * @param ratings Raw records
     * @return Records with value >= minRating, in input order
     */
    [[nodiscard]] auto apply(std::span<const Rating> ratings) const
        -> std::vector<Rating>;

    [[nodiscard]] auto minRating() const noexcept -> RatingValue {
        return minRating_;
    }

private:
    RatingValue minRating_;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_RATING_FILTER_HPP
