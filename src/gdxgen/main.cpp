/**
 * @file        gdxgen/main.cpp
 * @brief       gdxgen CLI tool entry point
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include "cli_utils.h"
#include "commands/codegen_command.h"
#include <gdx/codegen/codegen.h>
#include <gdx/cvar.h>
#include <gdx/logging.h>
#include <gdx/result.h>

#include <iostream>
#include <map>

// Codegen flags
GDXCVAR_DEFINE_STRING(output_dir, "gen", "Codegen", "Directory receiving the generated files");
GDXCVAR_DEFINE_STRING(precision, "single", "Codegen", "Float precision of builtin types: single or double");
GDXCVAR_DEFINE_BOOL(write_stats, true, "Codegen", "Write codegen-stats.txt with phase timings");

GDXCVAR_DEFINE_BOOL(help, false, "General", "Print usage and flag details");

using gdx::Result;

void PrintUsage() {
    std::cerr << "gdxgen - Godot extension API binding generator\n\n";
    std::cerr << "Usage: gdxgen <command> <extension_api.json> [flags]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  sys     Generate the FFI-level central file\n";
    std::cerr << "  core    Generate trait impls, variant dispatch, global and class enums\n";
    std::cerr << "  all     Generate both\n\n";
    std::cerr << "Run 'gdxgen --help' for flag details.\n";
}

int main(int argc, char** argv) {
    auto remaining = gdx::cvar::Init(argc, argv);
    gdx::cvar::ApplyEnvironment();

    if (GDXCVAR_GET(help)) {
        PrintUsage();
        std::cerr << "\n" << gdx::cvar::Usage();
        return 0;
    }

    for (const auto& error : gdx::cvar::ParseErrors()) {
        std::cerr << "error: " << error << "\n";
    }
    for (const auto& flag : gdx::cvar::UnknownFlags()) {
        std::cerr << "error: unknown flag --" << flag << "\n";
    }
    if (!gdx::cvar::ParseErrors().empty() || !gdx::cvar::UnknownFlags().empty()) {
        return 1;
    }

    std::string command;

    if (!remaining.empty()) {
        command = remaining[0];
    }

    if (command.empty()) {
        PrintUsage();
        return 1;
    }

    // Set up logging from CVARs
    std::string level_str = GDXCVAR_GET(log_level);
    std::string log_file_path = GDXCVAR_GET(log_file);
    bool verbose = GDXCVAR_GET(log_verbose);

    // Verbose overrides level if not explicitly set
    if (verbose && level_str == "info") {
        level_str = "trace";
        gdx::cvar::SetFlagByName("log_level", "trace");
    }

    std::map<std::string, std::string> category_levels;
    auto log_config = gdx::BuildLogConfig(
        log_file_path.empty() ? nullptr : log_file_path.c_str(),
        level_str,
        category_levels
    );
    gdx::InitLogging(log_config);

    // Register callback for runtime level changes
    gdx::RegisterLogLevelCallback();

    GDXLOG_INFO("gdxgen v0.1.0 - Godot extension API binding generator");

    auto target = gdx::codegen::ParseCodegenTarget(command);
    if (!target) {
        GDXLOG_ERROR("Unknown command: {}", command);
        PrintUsage();
        return 1;
    }
    if (remaining.size() < 2) {
        GDXLOG_ERROR("Missing API description. Usage: gdxgen {} <extension_api.json>", command);
        return 1;
    }
    if (remaining.size() > 2) {
        GDXLOG_ERROR("Too many arguments for {} command", command);
        return 1;
    }

    auto precision = gdx::codegen::ParsePrecision(GDXCVAR_GET(precision));
    if (!precision) {
        GDXLOG_ERROR("Invalid --precision '{}': expected single or double", GDXCVAR_GET(precision));
        return 1;
    }

    // Set up CLI context
    gdxgen::cli::CliContext ctx;
    ctx.verbose = verbose;
    ctx.output_dir = GDXCVAR_GET(output_dir);
    ctx.precision = *precision;
    ctx.write_stats = GDXCVAR_GET(write_stats);

    Result<void> result = gdxgen::cli::GenerateBindings(*target, remaining[1], ctx);

    if (!result) {
        GDXLOG_ERROR("Operation failed: {}", result.error().what());
        gdx::ShutdownLogging();
        return 1;
    }

    GDXLOG_INFO("Operation completed successfully");
    gdx::ShutdownLogging();
    return 0;
}
