/**
 * @file        gdxgen/commands/codegen_command.h
 * @brief       sys / core / all commands
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <filesystem>

#include <gdx/codegen/codegen.h>
#include <gdx/result.h>

#include "../cli_utils.h"

namespace gdxgen::cli {

/// Generate `target` from the API description at `api_json` into `ctx.output_dir`.
gdx::Result<void> GenerateBindings(gdx::codegen::CodegenTarget target, const std::filesystem::path& api_json,
                                   const CliContext& ctx);

}  // namespace gdxgen::cli
