/**
 * @file        gdx/codegen/enums.h
 * @brief       Rust definitions for engine enums and bitfields
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
#include <vector>

#include <gdx/codegen/models.h>

namespace gdx::codegen {

/// Type definition plus all trait implementations.
std::string make_enum_definition(const Enum& enum_);

/**
 * Emit an enum, its trait implementations, or both.
 *
 * The type and its traits can live in different crates: the type is then
 * emitted with `define_traits = false`, which exposes the `ord` field to
 * the crate that later emits the traits with `define_enum = false`.
 *
 * Exhaustive enums become `#[repr(i32)] pub enum`; all other enums and
 * bitfields become `#[repr(transparent)]` newtypes with associated
 * constants.
 *
 * @param item_attributes Attribute lines placed before every emitted item
 */
std::string make_enum_definition_with(const Enum& enum_, bool define_enum, bool define_traits,
                                      std::string_view item_attributes = "");

/// Definitions of several enums, each item prefixed by `cfg_attributes`.
std::string make_enums(const std::vector<Enum>& enums, std::string_view cfg_attributes);

/// Deprecated PascalCase constants aliasing each enumerator (`Nil` -> `NIL`).
std::string make_deprecated_enumerators(const Enum& enum_);

}  // namespace gdx::codegen
