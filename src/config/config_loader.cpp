/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Load and validate the ItemSim configuration file

**************************************************/

#include "config_loader.hpp"

#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace itemsim::config {

namespace {

template <ConfigSectionDerived Section>
void readSection(const json& document, Section& section) {
    const json::json_pointer pointer{std::string(Section::PATH)};
    if (!document.contains(pointer)) {
        spdlog::debug("Config section {} not present, using defaults",
                      Section::PATH);
        return;
    }

    const auto& node = document.at(pointer);
    if (!node.is_object()) {
        throw ConfigValidationException(std::string(Section::PATH) +
                                        ": section must be an object");
    }

    try {
        section = Section::deserialize(node);
    } catch (const json::exception& e) {
        throw ConfigValidationException(std::string(Section::PATH) + ": " +
                                        e.what());
    }
}

template <ConfigSectionDerived Section>
void writeSection(json& document, const Section& section) {
    document[json::json_pointer{std::string(Section::PATH)}] =
        section.serialize();
}

}  // namespace

json AppConfig::toJson() const {
    json document = json::object();
    writeSection(document, data);
    writeSection(document, similarity);
    writeSection(document, query);
    writeSection(document, logging);
    return document;
}

ConfigValidationResult AppConfig::validate() const {
    ConfigValidationResult result;
    result.merge(data.validate());
    result.merge(similarity.validate());
    result.merge(query.validate());
    result.merge(logging.validate());
    return result;
}

AppConfig parseConfig(const json& document) {
    if (!document.is_object()) {
        throw ConfigValidationException(
            "configuration root must be an object");
    }

    AppConfig config;
    readSection(document, config.data);
    readSection(document, config.similarity);
    readSection(document, config.query);
    readSection(document, config.logging);
    return config;
}

AppConfig loadConfigFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigIOException("Failed to open config file: " +
                                path.string());
    }

    json document;
    try {
        document = json::parse(ifs, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ConfigParseException("Failed to parse config file: " +
                                   path.string() + ", error message: " +
                                   e.what());
    }

    AppConfig config = parseConfig(document);
    if (auto result = config.validate(); !result) {
        spdlog::error("Invalid configuration in {}:\n{}", path.string(),
                      result.toString());
        throw ConfigValidationException("Invalid configuration in " +
                                        path.string() + ": " +
                                        result.toString());
    }

    spdlog::info("Config loaded from file: {}", path.string());
    return config;
}

}  // namespace itemsim::config
