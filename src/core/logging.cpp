/**
 * @file        core/logging.cpp
 * @brief       Category loggers built on spdlog
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/logging.h>
#include <gdx/string.h>

#include <array>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

GDXCVAR_DEFINE_STRING(log_level, "info", "Logging", "Log level: trace, debug, info, warn, error, critical, off");
GDXCVAR_DEFINE_STRING(log_file, "", "Logging", "Also write log output to this file");
GDXCVAR_DEFINE_BOOL(log_verbose, false, "Logging", "Shorthand for --log_level=trace");

namespace gdx {

namespace {

constexpr size_t kCategoryCount = 2;

std::array<std::shared_ptr<spdlog::logger>, kCategoryCount>& Loggers() {
    static std::array<std::shared_ptr<spdlog::logger>, kCategoryCount> loggers;
    return loggers;
}

std::shared_ptr<spdlog::sinks::sink> ConsoleSink() {
    static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
}

size_t CategoryIndex(LogCategory category) { return static_cast<size_t>(category); }

}  // namespace

const char* LogCategoryName(LogCategory category) {
    switch (category) {
    case LogCategory::Core:
        return "gdx";
    case LogCategory::Codegen:
        return "codegen";
    }
    return "gdx";
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text) {
    std::string lowered = string::to_lower_ascii(text);
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return std::nullopt;
}

LogConfig BuildLogConfig(const char* log_file, std::string_view level,
                         const std::map<std::string, std::string>& category_levels) {
    LogConfig config;
    if (log_file) {
        config.log_file = log_file;
    }
    config.level = ParseLogLevel(level).value_or(spdlog::level::info);
    for (const auto& [category, category_level] : category_levels) {
        if (auto parsed = ParseLogLevel(category_level)) {
            config.category_levels[category] = *parsed;
        }
    }
    return config;
}

void InitLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks{ConsoleSink()};
    std::string file_error;
    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto& loggers = Loggers();
    for (size_t i = 0; i < kCategoryCount; ++i) {
        const char* name = LogCategoryName(static_cast<LogCategory>(i));
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_pattern(config.pattern);

        auto level = config.level;
        if (auto it = config.category_levels.find(name); it != config.category_levels.end()) {
            level = it->second;
        }
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        loggers[i] = std::move(logger);
    }

    if (!file_error.empty()) {
        GDXLOG_ERROR("Failed to open log file {}: {}", config.log_file, file_error);
    }
}

void ShutdownLogging() {
    FlushLogging();
    for (auto& logger : Loggers()) {
        logger.reset();
    }
}

void FlushLogging() {
    for (auto& logger : Loggers()) {
        if (logger) {
            logger->flush();
        }
    }
}

void RegisterLogLevelCallback() {
    cvar::OnChange("log_level", [](std::string_view value) {
        auto level = ParseLogLevel(value);
        if (!level) {
            GDXLOG_WARN("Ignoring unknown log level '{}'", value);
            return;
        }
        for (auto& logger : Loggers()) {
            if (logger) {
                logger->set_level(*level);
            }
        }
    });
}

spdlog::logger* GetLogger(LogCategory category) {
    auto& slot = Loggers()[CategoryIndex(category)];
    if (!slot) {
        slot = std::make_shared<spdlog::logger>(LogCategoryName(category), ConsoleSink());
    }
    return slot.get();
}

}  // namespace gdx
