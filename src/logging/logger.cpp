/**
 * @file logger.cpp
 * @brief Implementation of structured logging for ad_silencer
 */

#include "logging/logger.h"

#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace ad_silencer {
namespace logging {

namespace {

constexpr const char* kLoggerName = "ad_silencer";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::info:
        return LogLevel::Info;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    case spdlog::level::off:
        return LogLevel::Off;
    default:
        return LogLevel::Info;
    }
}

// Caller holds g_init_mutex.
bool buildLoggerLocked(const LogConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);

        if (g_logger) {
            g_logger->flush();
        }
        spdlog::drop(kLoggerName);
        spdlog::set_default_logger(logger);
        g_logger = logger;
        g_initialized.store(true, std::memory_order_release);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire)) {
        // Already initialized, just update settings
        if (g_logger) {
            g_logger->set_level(toSpdlogLevel(config.level));
            for (auto& sink : g_logger->sinks()) {
                sink->set_level(toSpdlogLevel(config.level));
            }
            g_logger->set_pattern(config.pattern);
        }
        return true;
    }

    return buildLoggerLocked(config);
}

bool initializeEarly() {
    LogConfig config;
    config.filePath.clear();
    return initialize(config);
}

bool reconfigure(const LogConfig& config) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        ok = buildLoggerLocked(config);
    }
    if (ok) {
        LOG_DEBUG("Logging configured (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_INFO("Log file: {} (max {}KB x {} backups)", config.filePath,
                     config.maxFileSize / 1024, config.maxBackups);
        }
    }
    return ok;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
        LOG_DEBUG("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    // Fast path: already initialized (no lock)
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;
}

}  // namespace logging
}  // namespace ad_silencer
