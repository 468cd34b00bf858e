/**
 * @file        gdx/logging.h
 * @brief       Category loggers built on spdlog
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include <gdx/cvar.h>

GDXCVAR_DECLARE_STRING(log_level);
GDXCVAR_DECLARE_STRING(log_file);
GDXCVAR_DECLARE_BOOL(log_verbose);

namespace gdx {

enum class LogCategory {
    Core,
    Codegen,
};

struct LogConfig {
    std::string log_file;  // Empty: console only
    spdlog::level::level_enum level = spdlog::level::info;
    std::map<std::string, spdlog::level::level_enum> category_levels;
    std::string pattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
};

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text);

/**
 * Build a logging configuration from flag values.
 *
 * @param log_file Path of an additional file sink, or nullptr
 * @param level Default level name ("trace" ... "critical", "off")
 * @param category_levels Per-category overrides keyed by category name
 */
LogConfig BuildLogConfig(const char* log_file, std::string_view level,
                         const std::map<std::string, std::string>& category_levels);

void InitLogging(const LogConfig& config);
void ShutdownLogging();
void FlushLogging();

/// Re-apply `--log_level` whenever the flag changes at runtime.
void RegisterLogLevelCallback();

/// Never null; falls back to a console logger before InitLogging.
spdlog::logger* GetLogger(LogCategory category);

const char* LogCategoryName(LogCategory category);

}  // namespace gdx

#define GDXLOG_TRACE(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->trace(__VA_ARGS__)
#define GDXLOG_DEBUG(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->debug(__VA_ARGS__)
#define GDXLOG_INFO(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->info(__VA_ARGS__)
#define GDXLOG_WARN(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->warn(__VA_ARGS__)
#define GDXLOG_ERROR(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->error(__VA_ARGS__)
#define GDXLOG_CRITICAL(...) ::gdx::GetLogger(::gdx::LogCategory::Core)->critical(__VA_ARGS__)

#define GDXCODEGEN_TRACE(...) ::gdx::GetLogger(::gdx::LogCategory::Codegen)->trace(__VA_ARGS__)
#define GDXCODEGEN_DEBUG(...) ::gdx::GetLogger(::gdx::LogCategory::Codegen)->debug(__VA_ARGS__)
#define GDXCODEGEN_INFO(...) ::gdx::GetLogger(::gdx::LogCategory::Codegen)->info(__VA_ARGS__)
#define GDXCODEGEN_WARN(...) ::gdx::GetLogger(::gdx::LogCategory::Codegen)->warn(__VA_ARGS__)
#define GDXCODEGEN_ERROR(...) ::gdx::GetLogger(::gdx::LogCategory::Codegen)->error(__VA_ARGS__)

#define GDX_LOG_FLUSH() ::gdx::FlushLogging()

// Invariant violation: log, flush and abort. Not for input errors.
#define GDX_FATAL(...)                  \
    do {                                \
        GDXLOG_CRITICAL(__VA_ARGS__);   \
        ::gdx::FlushLogging();          \
        std::abort();                   \
    } while (0)
