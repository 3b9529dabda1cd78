/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef ITEMSIM_CONFIG_CONFIG_SECTION_HPP
#define ITEMSIM_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace itemsim::config {

using json = nlohmann::json;

/**
 * @brief Single validation error
 */
struct ConfigValidationError {
    std::string path;     ///< JSON path of the offending value
    std::string message;  ///< What is wrong with it
};

/**
 * @brief Validation result
 */
struct ConfigValidationResult {
    bool valid{true};                           ///< Whether validation passed
    std::vector<ConfigValidationError> errors;  ///< List of validation errors

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message) {
        valid = false;
        errors.push_back({std::move(path), std::move(message)});
    }

    /**
     * @brief Append all errors of @p other
     */
    void merge(const ConfigValidationResult& other) {
        for (const auto& error : other.errors) {
            addError(error.path, error.message);
        }
    }

    /**
     * @brief One "path: message" line per error
     */
    [[nodiscard]] std::string toString() const {
        std::string out;
        for (const auto& error : errors) {
            if (!out.empty()) {
                out += '\n';
            }
            out += error.path + ": " + error.message;
        }
        return out;
    }
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(const T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member (a JSON pointer into the
 *    configuration document)
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON, keeping
 *    defaults for missing keys
 * 4. Implement static generateSchema() to return JSON Schema
 *
 * and may implement checkValues() for range checks.
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/itemsim/query")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Convert this config to JSON
     */
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Try to create a configuration from JSON with error handling
     * @return Configuration instance or nullopt if a value has the wrong type
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(
        const json& j) noexcept {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Get the JSON Schema for this configuration section
     */
    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    /**
     * @brief Get a default-constructed configuration
     */
    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Validate value ranges of this configuration
     * @return Validation result with any errors
     */
    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        static_cast<const Derived*>(this)->checkValues(result);
        return result;
    }

    /**
     * @brief Check equality with another configuration
     */
    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Default range check, accepts everything
     */
    void checkValues(ConfigValidationResult&) const {}

    /**
     * @brief Child path of @p key under this section
     */
    [[nodiscard]] static std::string keyPath(std::string_view key) {
        return std::string(Derived::PATH) + "/" + std::string(key);
    }
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_CONFIG_SECTION_HPP
