#include "item_catalog.hpp"

#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "similarity/exception.hpp"
#include "text_fields.hpp"

namespace itemsim::io {

void ItemCatalog::add(similarity::ItemId itemId, std::string name) {
    names_.insert_or_assign(itemId, std::move(name));
}

auto ItemCatalog::lookup(similarity::ItemId itemId) const
    -> std::expected<std::string, std::string> {
    auto it = names_.find(itemId);
    if (it == names_.end()) {
        return std::unexpected("Item " + std::to_string(itemId) +
                               " not found in catalog");
    }
    return it->second;
}

auto loadItemCatalog(const std::string& path, char delimiter)
    -> std::expected<ItemCatalog, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Failed to open item catalog: {}", path);
        return std::unexpected("Failed to open item catalog: " + path);
    }

    ItemCatalog catalog;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (isBlank(line)) {
            continue;
        }

        auto fields = splitFields(line, delimiter);
        auto itemId = parseInt32(fields.front());
        if (!itemId || fields.size() < 2) {
            throw similarity::MalformedInputException(
                path + ":" + std::to_string(lineNumber) +
                ": expected '<id>" + delimiter + "<name>'");
        }
        catalog.add(*itemId, latin1ToUtf8(fields[1]));
    }

    spdlog::info("Loaded {} item names from {}", catalog.size(), path);
    return catalog;
}

}  // namespace itemsim::io
