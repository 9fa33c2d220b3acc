/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <marginalia/core/logger.hpp>
#include <marginalia/core/config.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdint>
#include <iostream>
#include <mutex>
#include <vector>

namespace marginalia {

static std::mutex s_loggerMutex;
static std::shared_ptr<spdlog::logger> s_logger;

namespace {

/// Non-positive or wrongly typed sizes keep the fallback
std::size_t positiveSetting(const Config& config, const std::string& key, std::size_t fallback) {
    const auto value = config.get<std::int64_t>(key, static_cast<std::int64_t>(fallback));
    if (value <= 0) {
        std::cerr << "Ignoring " << key << " = " << value << ", expected a positive integer" << std::endl;
        return fallback;
    }
    return static_cast<std::size_t>(value);
}

} // anonymous namespace

LoggingSettings LoggingSettings::fromConfig(const Config& config) {
    LoggingSettings settings;

    const auto levelName = config.get<std::string>("logging.level", "info");
    if (auto level = parseLogLevel(levelName)) {
        settings.level = *level;
    }

    settings.pattern = config.get<std::string>("logging.pattern", settings.pattern);
    settings.file = config.get<std::string>("logging.file", "");
    settings.maxFileSize = positiveSetting(config, "logging.max_file_size", settings.maxFileSize);
    settings.maxFiles = positiveSetting(config, "logging.max_files", settings.maxFiles);
    return settings;
}

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info") return spdlog::level::info;
    if (text == "warn" || text == "warning") return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    if (text == "critical") return spdlog::level::critical;
    if (text == "off") return spdlog::level::off;
    return std::nullopt;
}

void initLogging(const std::string& appName, spdlog::level::level_enum level) {
    LoggingSettings settings;
    settings.name = appName;
    settings.level = level;
    initLogging(settings);
}

void initLogging(const LoggingSettings& settings) {
    // Logs go to stderr so command output on stdout stays clean
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(settings.level);
    sinks.push_back(console_sink);

    if (!settings.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, settings.maxFileSize, settings.maxFiles);
            file_sink->set_level(settings.level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file initialization failed: " << ex.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(settings.name, sinks.begin(), sinks.end());
    logger->set_level(settings.level);
    logger->set_pattern(settings.pattern);

    {
        std::lock_guard<std::mutex> lock(s_loggerMutex);
        s_logger = logger;
    }
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    {
        std::lock_guard<std::mutex> lock(s_loggerMutex);
        if (s_logger) {
            return s_logger;
        }
    }
    initLogging("marginalia");
    std::lock_guard<std::mutex> lock(s_loggerMutex);
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(s_loggerMutex);
    if (s_logger) {
        s_logger->set_level(level);
        for (auto& sink : s_logger->sinks()) {
            sink->set_level(level);
        }
    }
}

} // namespace marginalia
