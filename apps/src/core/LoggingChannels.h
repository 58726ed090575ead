#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace BjornManager {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Config, Discovery, Events, Install, Network, Session, State, Ui };

const char* toString(LogChannel channel);

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Every channel is a named spdlog logger sharing the same console and file sinks,
 * so discovery chatter can be silenced without losing session or install traces.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the log pattern (e.g., "console")
     * @param consoleToStderr Send console output to stderr (keeps stdout for event output)
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>, then to
     * built-in defaults.
     * @return true if a config file was loaded, false if using defaults
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Apply per-channel level overrides.
     * @param overrides Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "session:trace,install:debug"
     *   "*:off,discovery:debug"
     */
    static void configureFromString(const std::string& overrides);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static bool setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createChannelLoggers(const std::vector<spdlog::sink_ptr>& sinks);
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);
    static nlohmann::json loadConfigFile(const std::string& configPath, bool* loaded);
    static void applyConfig(
        const nlohmann::json& config, const std::string& componentName, bool consoleToStderr);
    static void installDefaultLogger(
        const std::string& componentName,
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& filePath,
        bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros (e.g., from a C library header).
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...)                                                             \
    SPDLOG_LOGGER_TRACE(                                                                    \
        ::BjornManager::LoggingChannels::get(::BjornManager::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...)                                                             \
    SPDLOG_LOGGER_DEBUG(                                                                    \
        ::BjornManager::LoggingChannels::get(::BjornManager::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...)                                                              \
    SPDLOG_LOGGER_INFO(                                                                     \
        ::BjornManager::LoggingChannels::get(::BjornManager::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...)                                                              \
    SPDLOG_LOGGER_WARN(                                                                     \
        ::BjornManager::LoggingChannels::get(::BjornManager::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...)                                                             \
    SPDLOG_LOGGER_ERROR(                                                                    \
        ::BjornManager::LoggingChannels::get(::BjornManager::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace BjornManager
