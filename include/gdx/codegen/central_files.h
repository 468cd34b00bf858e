/**
 * @file        gdx/codegen/central_files.h
 * @brief       Central sys/core files: opaque types, build info, variant tags
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <string>
#include <string_view>

#include <gdx/codegen/models.h>

namespace gdx::codegen {

class Context;

/**
 * FFI-level central file.
 *
 * Opaque storage aliases for 32- and 64-bit targets, the `GdextBuild`
 * build-information struct and the `VariantType` type definition with its
 * raw conversions. Trait implementations for `VariantType` are left to
 * the core central file.
 */
std::string make_sys_central_code(const ExtensionApi& api);

/**
 * Core central file.
 *
 * `VariantType` trait implementations, the `VariantDispatch` enum and the
 * `global_enums` / `global_reexported_enums` modules.
 */
std::string make_core_central_code(const ExtensionApi& api, const Context& ctx);

/// `pub struct GdextBuild` with static version and build-configuration queries.
std::string make_gdext_build_struct(const GodotApiVersion& version, Precision precision);

/// Rust string literal body with `"` and `\` escaped.
std::string escape_rust_string(std::string_view text);

}  // namespace gdx::codegen
