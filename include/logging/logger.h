/**
 * @file logger.h
 * @brief Structured logging API for ad_silencer
 *
 * Provides a unified logging interface using spdlog.
 * Supports console output, rotating file output, and configurable log levels.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace ad_silencer {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Very detailed debugging information
    Debug,     // Per-detection and per-action details
    Info,      // General information
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                        // Empty = no file output
    std::size_t maxFileSize = static_cast<std::size_t>(1024 * 1024);  // 1 MB
    std::size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates the level
 * and pattern of the existing logger.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Lightweight initialization for logging before the config file is read.
 * Should be called before instance lock acquisition. Can be followed by
 * reconfigure() once the full configuration is known.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Replace the active logger with one built from config
 *
 * Used after initializeEarly() once the configuration file has been loaded.
 */
bool reconfigure(const LogConfig& config);

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

/**
 * @brief Set the global log level
 */
void setLevel(LogLevel level);

/**
 * @brief Get the current log level
 */
LogLevel getLevel();

/**
 * @brief Flush all pending log messages
 */
void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * For advanced use cases only.
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Convert LogLevel to string
 */
std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace ad_silencer

// Keep every level compiled in; --debug / AD_SILENCER_DEBUG select them at runtime
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                   \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_DEBUG(...)                                   \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_INFO(...)                                    \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_WARN(...)                                    \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_ERROR(...)                                   \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = ad_silencer::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)
