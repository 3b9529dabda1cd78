/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Load and validate the ItemSim configuration file

**************************************************/

#ifndef ITEMSIM_CONFIG_CONFIG_LOADER_HPP
#define ITEMSIM_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>

#include "config_section.hpp"
#include "sections/sections.hpp"

namespace itemsim::config {

/**
 * @brief Complete application configuration
 *
 * Every section keeps its defaults unless the document provides it.
 */
struct AppConfig {
    DataConfig data;
    SimilarityConfig similarity;
    QueryConfig query;
    LoggingConfig logging;

    /**
     * @brief Serialize all sections into one document keyed by their paths
     */
    [[nodiscard]] json toJson() const;

    /**
     * @brief Validate every section
     */
    [[nodiscard]] ConfigValidationResult validate() const;
};

/**
 * @brief Build a configuration from a parsed document
 *
 * Missing sections keep their defaults. Values are not range checked.
 *
 * @throws ConfigValidationException if a section or value has the wrong type
 */
[[nodiscard]] AppConfig parseConfig(const json& document);

/**
 * @brief Read, parse and validate a JSON configuration file
 *
 * @throws ConfigIOException if the file cannot be read
 * @throws ConfigParseException if the file is not valid JSON
 * @throws ConfigValidationException if a value is invalid
 */
[[nodiscard]] AppConfig loadConfigFile(const std::filesystem::path& path);

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_CONFIG_LOADER_HPP
