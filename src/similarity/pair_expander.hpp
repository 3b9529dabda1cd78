#ifndef ITEMSIM_SIMILARITY_PAIR_EXPANDER_HPP
#define ITEMSIM_SIMILARITY_PAIR_EXPANDER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "types.hpp"

namespace itemsim::similarity {

/**
 * @brief Combinatorial expansion of one user's ratings into item pairs
 *
 * For a profile of k ratings exactly C(k,2) contributions are produced,
 * each with itemA < itemB. No filtering or scoring happens here; the
 * fan-out is quadratic in k.
 */
class PairExpander {
public:
    using ContributionSink = std::function<void(const PairContribution&)>;

    /**
     * @brief Number of contributions a profile of @p k ratings expands to
     */
    [[nodiscard]] static constexpr auto pairCount(std::size_t k) noexcept
        -> std::uint64_t {
        return k < 2 ? 0
                     : static_cast<std::uint64_t>(k) * (k - 1) / 2;
    }

    /**
     * @brief Emit every pair contribution of @p profile to @p sink
     * @return Number of contributions emitted
     * @throws MalformedInputException if an itemId repeats in the profile
     */
    static auto expand(const UserProfile& profile,
                       const ContributionSink& sink) -> std::uint64_t;

    /**
     * @brief Collect the contributions of @p profile into a vector
     */
    [[nodiscard]] static auto expandAll(const UserProfile& profile)
        -> std::vector<PairContribution>;
};

}  // namespace itemsim::similarity

#endif  // ITEMSIM_SIMILARITY_PAIR_EXPANDER_HPP
