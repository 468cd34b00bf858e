/**
 * @file        gdxgen/cli_utils.h
 * @brief       Shared state for gdxgen commands
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <filesystem>

#include <gdx/codegen/models.h>

namespace gdxgen::cli {

struct CliContext {
    bool verbose = false;
    std::filesystem::path output_dir;
    gdx::codegen::Precision precision = gdx::codegen::Precision::Single;
    bool write_stats = true;
};

}  // namespace gdxgen::cli
