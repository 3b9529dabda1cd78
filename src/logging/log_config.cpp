/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "log_config.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

using json = nlohmann::json;

namespace itemsim::logging {

/**
 * @brief Sink that only counts messages for getMetrics()
 */
class CountingSink final : public spdlog::sinks::base_sink<std::mutex> {
protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        LogConfig::total_logs_.fetch_add(1, std::memory_order_relaxed);
        if (msg.level >= spdlog::level::err) {
            LogConfig::error_count_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void flush_() override {}
};

namespace {
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>
        logger_registry_;
    std::shared_mutex registry_mutex_;

    auto buildSinks(const LoggerConfig& config)
        -> std::vector<spdlog::sink_ptr> {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            spdlog::sink_ptr console_sink;
            if (config.consoleColor) {
                console_sink =
                    std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            } else {
                console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
            }
            console_sink->set_level(LogConfig::convertLevel(config.consoleLevel));
            console_sink->set_pattern(config.pattern);
            sinks.push_back(console_sink);
        }

        if (config.fileOutput) {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.logFilePath, config.maxFileSize, config.maxFiles);
            file_sink->set_level(LogConfig::convertLevel(config.fileLevel));
            file_sink->set_pattern(
                "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
            sinks.push_back(file_sink);
        }

        auto counting_sink = std::make_shared<CountingSink>();
        counting_sink->set_level(spdlog::level::trace);
        sinks.push_back(counting_sink);

        return sinks;
    }

    // The logger passes everything its most verbose sink wants
    auto loggerLevel(const LoggerConfig& config) -> spdlog::level::level_enum {
        auto level = spdlog::level::off;
        if (config.consoleOutput) {
            level = std::min(level, LogConfig::convertLevel(config.consoleLevel));
        }
        if (config.fileOutput) {
            level = std::min(level, LogConfig::convertLevel(config.fileLevel));
        }
        return level;
    }
}  // namespace

LoggerConfig LoggerConfig::fromSection(const config::LoggingConfig& section) {
    LoggerConfig config;
    config.consoleOutput = section.enableConsole;
    config.consoleLevel = config::logLevelFromString(section.consoleLevel);
    config.consoleColor = section.consoleColor;
    config.fileOutput = section.enableFile;
    config.fileLevel = config::logLevelFromString(section.fileLevel);
    config.logFilePath = (std::filesystem::path(section.logDir) /
                          (section.logFilename + ".log"))
                             .string();
    config.maxFileSize = section.maxFileSize;
    config.maxFiles = section.maxFiles;
    config.pattern = section.pattern;
    return config;
}

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already initialized
    }

    try {
        if (config.fileOutput) {
            auto parent = std::filesystem::path(config.logFilePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        }

        auto default_logger = getLogger(config.name, config);
        spdlog::set_default_logger(default_logger);

        spdlog::set_error_handler([](const std::string& msg) {
            error_count_.fetch_add(1, std::memory_order_relaxed);
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        default_logger->debug("Logging initialized (console: {}, file: {})",
                              config.consoleOutput,
                              config.fileOutput ? config.logFilePath : "off");

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

auto LogConfig::getLogger(std::string_view name, const LoggerConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};

    {
        std::shared_lock lock(registry_mutex_);
        if (auto it = logger_registry_.find(nameStr);
            it != logger_registry_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(registry_mutex_);

    if (auto it = logger_registry_.find(nameStr);
        it != logger_registry_.end()) {
        return it->second;
    }

    try {
        auto sinks = buildSinks(config);
        auto logger = std::make_shared<spdlog::logger>(nameStr, sinks.begin(),
                                                       sinks.end());
        logger->set_level(loggerLevel(config));

        if (config.flushOnError) {
            logger->flush_on(spdlog::level::err);
        }

        // A logger of the same name created elsewhere is replaced
        spdlog::drop(nameStr);
        spdlog::register_logger(logger);
        logger_registry_.emplace(nameStr, logger);

        return logger;

    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error(
            fmt::format("Failed to create logger '{}': {}", name, e.what()));
    }
}

void LogConfig::setGlobalLevel(LogLevel level) {
    spdlog::set_level(convertLevel(level));
}

void LogConfig::flushAll() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l) {
        l->flush();
    });
}

void LogConfig::shutdown() {
    std::unique_lock lock(registry_mutex_);
    for (const auto& [name, logger] : logger_registry_) {
        logger->flush();
        spdlog::drop(name);
    }
    logger_registry_.clear();
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
    initialized_.store(false, std::memory_order_release);
}

auto LogConfig::getMetrics() -> json {
    json metrics;
    metrics["total_logs"] = total_logs_.load(std::memory_order_relaxed);
    metrics["error_count"] = error_count_.load(std::memory_order_relaxed);
    metrics["initialized"] = initialized_.load(std::memory_order_relaxed);

    std::shared_lock lock(registry_mutex_);
    metrics["registered_loggers"] = logger_registry_.size();

    std::vector<std::string> logger_names;
    logger_names.reserve(logger_registry_.size());
    for (const auto& [name, logger] : logger_registry_) {
        logger_names.push_back(name);
    }
    std::sort(logger_names.begin(), logger_names.end());
    metrics["logger_names"] = std::move(logger_names);
    return metrics;
}

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace itemsim::logging
