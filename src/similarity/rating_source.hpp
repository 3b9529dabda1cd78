#ifndef ITEMSIM_SIMILARITY_RATING_SOURCE_HPP
#define ITEMSIM_SIMILARITY_RATING_SOURCE_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Finite, lazily produced sequence of rating records
 *
 * Implementations report bad records by throwing MalformedInputException
 * from next(); the core does not try to recover from them.
 */
class IRatingSource {
public:
    virtual ~IRatingSource() = default;

    /**
     * @brief Produce the next rating
     * @return std::nullopt once the sequence is exhausted
     */
    [[nodiscard]] virtual auto next() -> std::optional<Rating> = 0;
};

/**
 * @brief Rating source over an in-memory vector
 */
class VectorRatingSource : public IRatingSource {
public:
    explicit VectorRatingSource(std::vector<Rating> ratings)
        : ratings_(std::move(ratings)) {}

    [[nodiscard]] auto next() -> std::optional<Rating> override {
        if (position_ >= ratings_.size()) {
            return std::nullopt;
        }
        return ratings_[position_++];
    }

    void rewind() noexcept { position_ = 0; }

private:
    std::vector<Rating> ratings_;
    std::size_t position_ = 0;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_RATING_SOURCE_HPP
