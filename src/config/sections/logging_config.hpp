/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration for console and rotating file sinks

**************************************************/

#ifndef ITEMSIM_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define ITEMSIM_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <cstddef>
#include <string>

#include "../config_section.hpp"

namespace itemsim::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Convert LogLevel to string
 */
[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Whether @p str names a log level
 */
[[nodiscard]] inline bool isLogLevelName(const std::string& str) {
    return str == "trace" || str == "debug" || str == "info" ||
           str == "warn" || str == "warning" || str == "error" ||
           str == "err" || str == "critical" || str == "fatal" ||
           str == "off" || str == "none";
}

/**
 * @brief Convert string to LogLevel, unknown names map to Info
 */
[[nodiscard]] inline LogLevel logLevelFromString(const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * {
 *   "itemsim": {
 *     "logging": {
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "logFilename": "itemsim",
 *       "fileLevel": "trace",
 *       "maxFileSize": 10485760,
 *       "maxFiles": 5
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/itemsim/logging";

    // ========================================================================
    // Console Settings
    // ========================================================================

    bool enableConsole{true};          ///< Enable console output
    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< Enable ANSI color codes

    // ========================================================================
    // File Settings
    // ========================================================================

    bool enableFile{false};              ///< Enable file output
    std::string logDir{"logs"};          ///< Log directory path
    std::string logFilename{"itemsim"};  ///< Base filename (without extension)
    std::string fileLevel{"trace"};      ///< File log level

    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation (10 MB)
    size_t maxFiles{5};                     ///< Max number of rotated files

    // ========================================================================
    // Format Settings
    // ========================================================================

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %v (message)
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"};

    [[nodiscard]] json serialize() const {
        return {
            // Console
            {"enableConsole", enableConsole},
            {"consoleLevel", consoleLevel},
            {"consoleColor", consoleColor},
            // File
            {"enableFile", enableFile},
            {"logDir", logDir},
            {"logFilename", logFilename},
            {"fileLevel", fileLevel},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles},
            // Format
            {"pattern", pattern}
        };
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        // Console
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        // File
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);

        // Format
        cfg.pattern = j.value("pattern", cfg.pattern);

        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                // Console
                {"enableConsole", {{"type", "boolean"}, {"default", true}}},
                {"consoleLevel", {
                    {"type", "string"},
                    {"enum", {"trace", "debug", "info", "warn", "error", "critical", "off"}},
                    {"default", "info"}
                }},
                {"consoleColor", {{"type", "boolean"}, {"default", true}}},
                // File
                {"enableFile", {{"type", "boolean"}, {"default", false}}},
                {"logDir", {{"type", "string"}, {"default", "logs"}}},
                {"logFilename", {{"type", "string"}, {"default", "itemsim"}}},
                {"fileLevel", {
                    {"type", "string"},
                    {"enum", {"trace", "debug", "info", "warn", "error", "critical", "off"}},
                    {"default", "trace"}
                }},
                {"maxFileSize", {
                    {"type", "integer"},
                    {"minimum", 1024},
                    {"maximum", 1073741824},  // 1 GB
                    {"default", 10485760}
                }},
                {"maxFiles", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 100},
                    {"default", 5}
                }},
                // Format
                {"pattern", {{"type", "string"}}}
            }}
        };
    }

    void checkValues(ConfigValidationResult& result) const {
        if (!isLogLevelName(consoleLevel)) {
            result.addError(keyPath("consoleLevel"),
                            "unknown log level '" + consoleLevel + "'");
        }
        if (!isLogLevelName(fileLevel)) {
            result.addError(keyPath("fileLevel"),
                            "unknown log level '" + fileLevel + "'");
        }
        if (enableFile && logFilename.empty()) {
            result.addError(keyPath("logFilename"), "must not be empty");
        }
        if (maxFileSize < 1024) {
            result.addError(keyPath("maxFileSize"), "must be >= 1024");
        }
        if (maxFiles < 1) {
            result.addError(keyPath("maxFiles"), "must be >= 1");
        }
    }
};

}  // namespace itemsim::config

#endif  // ITEMSIM_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
