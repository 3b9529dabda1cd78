/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration for ItemSim

**************************************************/

#ifndef ITEMSIM_LOGGING_LOG_CONFIG_HPP
#define ITEMSIM_LOGGING_LOG_CONFIG_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace itemsim::logging {

using config::LogLevel;

struct LoggerConfig {
    std::string name{"itemsim"};
    LogLevel consoleLevel = LogLevel::Info;
    LogLevel fileLevel = LogLevel::Trace;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool consoleOutput = true;
    bool consoleColor = true;
    bool fileOutput = false;
    std::string logFilePath = "logs/itemsim.log";
    std::size_t maxFileSize = 1048576 * 10;  // 10MB
    std::size_t maxFiles = 5;
    bool flushOnError = true;

    /**
     * @brief Logger settings described by a logging configuration section
     */
    [[nodiscard]] static LoggerConfig fromSection(
        const config::LoggingConfig& section);
};

/**
 * @brief spdlog setup shared by the library and the command line tool
 *
 * Loggers are synchronous. Every logger carries a counting sink that feeds
 * getMetrics().
 */
class LogConfig {
public:
    /**
     * @brief Initialize global spdlog configuration
     *
     * Creates the default logger named after @p config. A second call
     * without shutdown() in between is ignored.
     *
     * @param config Logger configuration
     * @throws std::runtime_error if a sink cannot be created
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create a logger
     * @param name Logger name
     * @param config Sink settings used when the logger is created
     * @return Shared pointer to logger
     */
    static auto getLogger(std::string_view name,
                          const LoggerConfig& config = LoggerConfig{})
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set the level of every registered logger
     */
    static void setGlobalLevel(LogLevel level);

    /**
     * @brief Flush all loggers
     */
    static void flushAll();

    /**
     * @brief Drop every logger created here and allow initialize() again
     */
    static void shutdown();

    [[nodiscard]] static bool isInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Get logging metrics
     * @return JSON object with message counters and logger names
     */
    static auto getMetrics() -> nlohmann::json;

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;

private:
    friend class CountingSink;

    static inline std::atomic<bool> initialized_{false};

    static inline std::atomic<std::uint64_t> total_logs_{0};
    static inline std::atomic<std::uint64_t> error_count_{0};
};

}  // namespace itemsim::logging

#endif  // ITEMSIM_LOGGING_LOG_CONFIG_HPP
