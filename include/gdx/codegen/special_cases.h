/**
 * @file        gdx/codegen/special_cases.h
 * @brief       Hand-maintained exceptions to the generic mapping rules
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <optional>
#include <string_view>

#include <gdx/codegen/api_version.h>
#include <gdx/codegen/models.h>
#include <gdx/result.h>

namespace gdx::codegen {
struct JsonClass;
}

// All lookups take names as spelled in the API description. Enum lookups
// take the surrounding class (nullopt for global enums).
namespace gdx::codegen::special_cases {

/// Classes that are platform specific, editor internal or otherwise unusable.
bool is_class_deleted(std::string_view class_name);

bool is_class_method_deleted(std::string_view class_name, std::string_view method_name);

bool is_utility_function_deleted(std::string_view function_name);

/// Rust name for methods whose engine name collides with Rust conventions (`new`).
std::optional<std::string_view> maybe_rename_class_method(std::string_view class_name,
                                                          std::string_view method_name);

/// Closed enums: future engine versions are not expected to add enumerators.
bool is_enum_exhaustive(std::optional<std::string_view> class_name, std::string_view enum_name);

/// Enums exposed through a dedicated wrapper rather than the global module.
bool is_enum_private(std::optional<std::string_view> class_name, std::string_view enum_name);

/**
 * Companion bitfield an enum can be OR-ed with (`Key | KeyModifierMask`).
 *
 * @return The mask type, or nullopt when the enum has no companion
 */
std::optional<RustTy> as_enum_bitmaskable(const Enum& enum_);

bool is_class_level_server(std::string_view class_name);
bool is_class_level_core(std::string_view class_name);

/// Classes the engine marks experimental; generated behind a cargo feature.
bool is_class_experimental(std::string_view class_name);

/// Editor classes misclassified as `core` by engine releases before 4.3.
bool is_class_editor_override(std::string_view class_name, ApiVersion active);

/**
 * Codegen level of a class.
 *
 * Registry overrides first, then `api_type` ("core" or "editor").
 *
 * @return Validation error for an unknown `api_type`
 */
Result<ClassCodegenLevel> get_api_level(const JsonClass& class_, ApiVersion active);

}  // namespace gdx::codegen::special_cases
