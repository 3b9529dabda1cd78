/*
 * data_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Input dataset locations

**************************************************/

#ifndef ITEMSIM_CONFIG_SECTIONS_DATA_CONFIG_HPP
#define ITEMSIM_CONFIG_SECTIONS_DATA_CONFIG_HPP

#include <string>

#include "../config_section.hpp"

namespace itemsim::config {

/**
 * @brief Where the ratings and the item catalog are read from
 */
struct DataConfig : ConfigSection<DataConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/itemsim/data";

    std::string ratingsPath{"data/ml-100k/u.data"};
    std::string itemsPath{"data/ml-100k/u.item"};
    std::string ratingsDelimiter{"\t"};
    std::string itemsDelimiter{"|"};

    [[nodiscard]] json serialize() const {
        return {{"ratingsPath", ratingsPath},
                {"itemsPath", itemsPath},
                {"ratingsDelimiter", ratingsDelimiter},
                {"itemsDelimiter", itemsDelimiter}};
    }

    [[nodiscard]] static DataConfig deserialize(const json& j) {
        DataConfig cfg;
        cfg.ratingsPath = j.value("ratingsPath", cfg.ratingsPath);
        cfg.itemsPath = j.value("itemsPath", cfg.itemsPath);
        cfg.ratingsDelimiter = j.value("ratingsDelimiter", cfg.ratingsDelimiter);
        cfg.itemsDelimiter = j.value("itemsDelimiter", cfg.itemsDelimiter);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"ratingsPath", {{"type", "string"}, {"default", "data/ml-100k/u.data"}}},
                {"itemsPath", {{"type", "string"}, {"default", "data/ml-100k/u.item"}}},
                {"ratingsDelimiter", {{"type", "string"}, {"minLength", 1}, {"maxLength", 1}}},
                {"itemsDelimiter", {{"type", "string"}, {"minLength", 1}, {"maxLength", 1}}}
            }}
        };
    }

    void checkValues(ConfigValidationResult& result) const {
        if (ratingsPath.empty()) {
            result.addError(keyPath("ratingsPath"), "must not be empty");
        }
        if (itemsPath.empty()) {
            result.addError(keyPath("itemsPath"), "must not be empty");
        }
        if (ratingsDelimiter.size() != 1) {
            result.addError(keyPath("ratingsDelimiter"),
                            "must be a single character");
        }
        if (itemsDelimiter.size() != 1) {
            result.addError(keyPath("itemsDelimiter"),
                            "must be a single character");
        }
    }
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_SECTIONS_DATA_CONFIG_HPP
