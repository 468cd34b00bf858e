/**
 * @file        gdx/codegen/loader.h
 * @brief       Raw API records to domain model
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

#include <gdx/codegen/models.h>
#include <gdx/result.h>

namespace gdx::codegen {

class Context;
struct JsonEnum;
struct JsonExtensionApi;

/**
 * Build the domain model.
 *
 * Expects records that were already filtered with FilterByApiVersion.
 * Deleted classes, methods and utility functions are dropped; enum names
 * and enumerator names are converted to their Rust spelling.
 *
 * @param precision Selects which `builtin_class_sizes` columns are kept
 * @return Validation error for duplicate names, out-of-range values,
 *         duplicate ordinals in exhaustive enums or a missing `Variant.Type`
 */
Result<ExtensionApi> MapDomainModels(const JsonExtensionApi& json, const Context& ctx, Precision precision);

/// Map a single enum; exposed for tests.
Result<Enum> MapEnum(const JsonEnum& json, std::optional<std::string_view> surrounding_class);

}  // namespace gdx::codegen
