#ifndef ITEMSIM_IO_ITEM_CATALOG_HPP
#define ITEMSIM_IO_ITEM_CATALOG_HPP

#include <cstddef>
#include <expected>
#include <string>
#include <unordered_map>

#include "similarity/types.hpp"

namespace itemsim::io {

/**
 * @brief Item id -> display name lookup
 *
 * Passed explicitly to whoever renders results; the similarity core never
 * sees it.
 */
class ItemCatalog {
public:
    /**
     * @brief Register or rename an item
     */
    void add(similarity::ItemId itemId, std::string name);

    /**
     * @brief Display name of @p itemId
     * @return Name, or a "not found" error message for unknown ids
     */
    [[nodiscard]] auto lookup(similarity::ItemId itemId) const
        -> std::expected<std::string, std::string>;

    [[nodiscard]] bool contains(similarity::ItemId itemId) const {
        return names_.contains(itemId);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return names_.size();
    }

private:
    std::unordered_map<similarity::ItemId, std::string> names_;
};

/**
 * @brief Load a catalog from a MovieLens u.item style file
 *
 * Lines are "itemId<delim>name<delim>..."; names are decoded from
 * ISO-8859-1. Blank lines are skipped, a non-numeric id throws
 * MalformedInputException.
 *
 * @param path Catalog file
 * @param delimiter Field separator
 * @return Catalog, or error message if the file cannot be opened
 */
[[nodiscard]] auto loadItemCatalog(const std::string& path,
                                   char delimiter = '|')
    -> std::expected<ItemCatalog, std::string>;

}  // namespace itemsim::io

#endif  // ITEMSIM_IO_ITEM_CATALOG_HPP
