/**
 * @file        gdx/codegen/conv.h
 * @brief       Identifier case conversion and Godot-to-Rust type mapping
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gdx/codegen/models.h>

namespace gdx::codegen {
class Context;
}

namespace gdx::codegen::conv {

/// `Node2D` -> `node_2d`, `HTTPRequest` -> `http_request`.
std::string to_snake_case(std::string_view name);

/// `AABB` -> `Aabb`, `int` -> `Int`, `GDScript` -> `GDScript`.
std::string to_pascal_case(std::string_view name);

/// `PACKED_BYTE_ARRAY` -> `PackedByteArray`.
std::string shout_to_pascal(std::string_view name);

/// `Variant.Type` -> `VariantType`.
std::string make_enum_name(std::string_view godot_enum_name);

/**
 * Rust enumerator names for one enum.
 *
 * Removes the longest `_`-separated word prefix shared by all names
 * (`TYPE_NIL`, `TYPE_INT` -> `NIL`, `INT`). A name whose remainder would
 * start with a digit keeps its full spelling (`KEY_0`). Falls back to the
 * unstripped names if stripping creates duplicates.
 */
std::vector<std::string> make_enumerator_names(const std::vector<std::string>& godot_names);

bool is_rust_keyword(std::string_view ident);

/// Appends `_` to Rust keywords.
std::string safe_ident(std::string_view ident);

/// Key used to match `VARIANT_TYPE` spellings against builtin names: `PackedByteArray` -> `PACKEDBYTEARRAY`.
std::string normalize_type_name(std::string_view name);

/**
 * Rust type for a Godot type string.
 *
 * Handles primitives with their `meta` width, builtins, engine classes,
 * `enum::` / `bitfield::` references, `typedarray::` and raw pointers.
 * Unknown names are logged and mapped to their PascalCase spelling.
 */
RustTy to_rust_type(std::string_view godot_type, std::optional<std::string_view> meta, const Context& ctx);

}  // namespace gdx::codegen::conv
