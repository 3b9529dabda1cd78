#include "recommendation_printer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace itemsim::io {

auto RecommendationPrinter::displayName(similarity::ItemId itemId) const
    -> std::string {
    auto name = catalog_.lookup(itemId);
    if (!name) {
        spdlog::warn("{}", name.error());
        return fmt::format("Item #{}", itemId);
    }
    return *name;
}

void RecommendationPrinter::printList(
    std::ostream& out,
    std::span<const similarity::Recommendation> list) const {
    const std::string rule(RULE_WIDTH, '-');
    for (const auto& rec : list) {
        out << rule << '\n'
            << fmt::format("{} viewers also watched:\n{}\nSimilarity Score: "
                           "{:.6f}\n",
                           rec.supportCount, displayName(rec.itemId),
                           rec.score)
            << '\n';
    }
}

void RecommendationPrinter::print(
    std::ostream& out, similarity::ItemId target,
    const similarity::RecommendationResult& result) const {
    auto targetName = displayName(target);

    out << fmt::format(
        "Top {} recommendations for {} based on cosine similarity score of "
        "ratings:\n\n",
        result.byScore.size(), targetName);
    if (result.byScore.empty()) {
        out << "No items passed the similarity and support thresholds.\n\n";
    }
    printList(out, result.byScore);

    out << std::string(RULE_WIDTH, '=') << '\n';

    out << fmt::format(
        "Top {} recommendations for {} based on the number of shared "
        "viewers:\n\n",
        result.bySupport.size(), targetName);
    if (result.bySupport.empty()) {
        out << "No items passed the similarity and support thresholds.\n\n";
    }
    printList(out, result.bySupport);
}

}  // namespace itemsim::io
