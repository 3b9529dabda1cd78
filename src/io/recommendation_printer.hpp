#ifndef ITEMSIM_IO_RECOMMENDATION_PRINTER_HPP
#define ITEMSIM_IO_RECOMMENDATION_PRINTER_HPP

#include <ostream>
#include <span>
#include <string>

#include "item_catalog.hpp"
#include "similarity/types.hpp"

namespace itemsim::io {

/**
 * @brief Renders query results for a terminal
 *
 * Item names come from the catalog given at construction; ids missing
 * from it are shown as "Item #<id>".
 */
class RecommendationPrinter {
public:
    static constexpr int RULE_WIDTH = 80;

    explicit RecommendationPrinter(const ItemCatalog& catalog)
        : catalog_(catalog) {}

    /**
     * @brief Print both views for @p target
     */
    void print(std::ostream& out, similarity::ItemId target,
               const similarity::RecommendationResult& result) const;

    /**
     * @brief Print one list of recommendations
     */
    void printList(std::ostream& out,
                   std::span<const similarity::Recommendation> list) const;

    /**
     * @brief Catalog name of @p itemId or the "Item #<id>" placeholder
     */
    [[nodiscard]] auto displayName(similarity::ItemId itemId) const
        -> std::string;

private:
    const ItemCatalog& catalog_;
};

}  // namespace itemsim::io

#endif  // ITEMSIM_IO_RECOMMENDATION_PRINTER_HPP
