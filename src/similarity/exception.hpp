#ifndef ITEMSIM_SIMILARITY_EXCEPTION_HPP
#define ITEMSIM_SIMILARITY_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace itemsim::similarity {

/**
 * @brief Base exception class for similarity engine errors
 */
class SimilarityException : public std::runtime_error {
public:
    explicit SimilarityException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A rating record or profile that violates the input contract
 */
class MalformedInputException : public SimilarityException {
public:
    explicit MalformedInputException(const std::string& message)
        : SimilarityException(message) {}
};

/**
 * @brief An accumulator left its exactly representable range
 *
 * Fatal for the aggregation run; intermediate state is not reusable.
 */
class AggregationOverflowException : public SimilarityException {
public:
    explicit AggregationOverflowException(const std::string& message)
        : SimilarityException(message) {}
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_EXCEPTION_HPP
