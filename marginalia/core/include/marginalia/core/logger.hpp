/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * Provides a thin wrapper around spdlog with convenient macros.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace marginalia {

class Config;

/// Logger setup read from the "logging.*" configuration keys
struct LoggingSettings {
    std::string name = "marginalia";
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    std::string file;                            // empty = console only
    std::size_t maxFileSize = 10 * 1024 * 1024;  // 10MB
    std::size_t maxFiles = 3;

    static LoggingSettings fromConfig(const Config& config);
};

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text);

/// Initialize logging with a console sink only
void initLogging(const std::string& appName, spdlog::level::level_enum level = spdlog::level::info);

/// Initialize logging from settings (console sink plus optional rotating file)
void initLogging(const LoggingSettings& settings);

/**
 * @brief Get default logger
 *
 * The first call before any initLogging() creates a console logger named
 * "marginalia" and installs it as spdlog's default logger, replacing the
 * one a host process may have set. Hosts that own spdlog configuration
 * should call initLogging() first.
 */
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

} // namespace marginalia

#define MARGINALIA_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(marginalia::getLogger(), __VA_ARGS__)
#define MARGINALIA_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(marginalia::getLogger(), __VA_ARGS__)
#define MARGINALIA_LOG_INFO(...)     SPDLOG_LOGGER_INFO(marginalia::getLogger(), __VA_ARGS__)
#define MARGINALIA_LOG_WARN(...)     SPDLOG_LOGGER_WARN(marginalia::getLogger(), __VA_ARGS__)
#define MARGINALIA_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(marginalia::getLogger(), __VA_ARGS__)
#define MARGINALIA_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(marginalia::getLogger(), __VA_ARGS__)
