/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef ITEMSIM_CONFIG_EXCEPTION_HPP
#define ITEMSIM_CONFIG_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace itemsim::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public std::runtime_error {
public:
    explicit BadConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

/**
 * @brief Exception for configuration text that is not valid JSON
 */
class ConfigParseException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

/**
 * @brief Exception for configuration validation failure
 */
class ConfigValidationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_EXCEPTION_HPP
