/**
 * @file        gdxgen/commands/codegen_command.cpp
 * @brief       sys / core / all commands
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include "codegen_command.h"

#include <gdx/codegen/context.h>
#include <gdx/logging.h>

#include <fmt/format.h>

namespace gdxgen::cli {

using gdx::Err;
using gdx::ErrorCategory;
using gdx::codegen::CodegenOptions;
using gdx::codegen::CodegenPipeline;

gdx::Result<void> GenerateBindings(gdx::codegen::CodegenTarget target, const std::filesystem::path& api_json,
                                   const CliContext& ctx) {
    if (!std::filesystem::exists(api_json)) {
        return Err(ErrorCategory::IO, fmt::format("API description not found: {}", api_json.string()));
    }
    if (ctx.output_dir.empty()) {
        return Err(ErrorCategory::Validation, "--output_dir must not be empty");
    }

    CodegenOptions options;
    options.api_json = api_json;
    options.output_dir = ctx.output_dir;
    options.precision = ctx.precision;
    options.target = target;
    options.write_stats = ctx.write_stats;

    auto pipeline = CodegenPipeline::Create(options);
    if (!pipeline) {
        return Err(pipeline.error());
    }

    GDXLOG_INFO("Generating {} bindings for Godot {}", gdx::codegen::CodegenTargetName(target),
                pipeline->context().api_version().ToString());
    GDX_LOG_FLUSH();
    return pipeline->Run();
}

}  // namespace gdxgen::cli
