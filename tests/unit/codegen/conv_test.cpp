/**
 * @file        tests/unit/codegen/conv_test.cpp
 * @brief       Unit tests for identifier case conversion and type mapping
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <gdx/codegen/conv.h>

#include "test_api.h"

using namespace gdx::codegen;
using namespace gdx::codegen::conv;

// =============================================================================
// Case conversion
// =============================================================================

TEST_CASE("to_snake_case splits words and keeps dimension suffixes together", "[conv]") {
  CHECK(to_snake_case("Node") == "node");
  CHECK(to_snake_case("Node2D") == "node_2d");
  CHECK(to_snake_case("Node3D") == "node_3d");
  CHECK(to_snake_case("Texture1D") == "texture_1d");
  CHECK(to_snake_case("HTTPRequest") == "http_request");
  CHECK(to_snake_case("RenderingServer") == "rendering_server");
  CHECK(to_snake_case("AABB") == "aabb");
  CHECK(to_snake_case("get_child_count") == "get_child_count");
}

TEST_CASE("to_snake_case handles irregular class names", "[conv]") {
  CHECK(to_snake_case("JSONRPC") == "json_rpc");
  CHECK(to_snake_case("OpenXRAPIExtension") == "open_xr_api_extension");
  CHECK(to_snake_case("OpenXRIPBinding") == "open_xr_ip_binding");
}

TEST_CASE("to_pascal_case", "[conv]") {
  CHECK(to_pascal_case("int") == "Int");
  CHECK(to_pascal_case("bool") == "Bool");
  CHECK(to_pascal_case("AABB") == "Aabb");
  CHECK(to_pascal_case("Vector2i") == "Vector2i");
  CHECK(to_pascal_case("Transform2D") == "Transform2D");
  CHECK(to_pascal_case("PackedByteArray") == "PackedByteArray");
  CHECK(to_pascal_case("GDScript") == "GDScript");
  CHECK(to_pascal_case("GDExtension") == "GDExtension");
}

TEST_CASE("shout_to_pascal and make_enum_name", "[conv]") {
  CHECK(shout_to_pascal("NIL") == "Nil");
  CHECK(shout_to_pascal("PACKED_BYTE_ARRAY") == "PackedByteArray");
  CHECK(shout_to_pascal("VECTOR2I") == "Vector2i");
  CHECK(make_enum_name("Variant.Type") == "VariantType");
  CHECK(make_enum_name("ProcessMode") == "ProcessMode");
}

// =============================================================================
// Enumerator names
// =============================================================================

TEST_CASE("make_enumerator_names strips the shared word prefix", "[conv]") {
  CHECK(make_enumerator_names({"TYPE_NIL", "TYPE_BOOL", "TYPE_PACKED_BYTE_ARRAY", "TYPE_MAX"}) ==
        std::vector<std::string>{"NIL", "BOOL", "PACKED_BYTE_ARRAY", "MAX"});
  CHECK(make_enumerator_names({"PROCESS_MODE_INHERIT", "PROCESS_MODE_WHEN_PAUSED"}) ==
        std::vector<std::string>{"INHERIT", "WHEN_PAUSED"});
  CHECK(make_enumerator_names({"METHOD_FLAG_NORMAL", "METHOD_FLAGS_DEFAULT"}) ==
        std::vector<std::string>{"FLAG_NORMAL", "FLAGS_DEFAULT"});
}

TEST_CASE("make_enumerator_names leaves at least one word per name", "[conv]") {
  CHECK(make_enumerator_names({"SIDE", "SIDE_LEFT"}) == std::vector<std::string>{"SIDE", "SIDE_LEFT"});
  CHECK(make_enumerator_names({"A_B", "A_B_C"}) == std::vector<std::string>{"B", "B_C"});
  CHECK(make_enumerator_names({"X_Y_A", "X_Z_A", "X_A"}) == std::vector<std::string>{"Y_A", "Z_A", "A"});
}

TEST_CASE("make_enumerator_names keeps full names when stripping is unsafe", "[conv]") {
  SECTION("no shared prefix") {
    CHECK(make_enumerator_names({"VERTICAL", "HORIZONTAL"}) ==
          std::vector<std::string>{"VERTICAL", "HORIZONTAL"});
  }
  SECTION("remainder starting with a digit") {
    CHECK(make_enumerator_names({"KEY_0", "KEY_A"}) == std::vector<std::string>{"KEY_0", "A"});
  }
  SECTION("single enumerator") {
    CHECK(make_enumerator_names({"FLAG_ONLY"}) == std::vector<std::string>{"FLAG_ONLY"});
  }
  SECTION("stripping creates duplicates") {
    CHECK(make_enumerator_names({"K_0", "K_K_0"}) == std::vector<std::string>{"K_0", "K_K_0"});
  }
}

TEST_CASE("safe_ident escapes Rust keywords", "[conv]") {
  CHECK(is_rust_keyword("type"));
  CHECK(is_rust_keyword("Self"));
  CHECK_FALSE(is_rust_keyword("node"));
  CHECK(safe_ident("type") == "type_");
  CHECK(safe_ident("match") == "match_");
  CHECK(safe_ident("internal") == "internal");
  CHECK(normalize_type_name("PACKED_BYTE_ARRAY") == normalize_type_name("PackedByteArray"));
}

// =============================================================================
// Type mapping
// =============================================================================

TEST_CASE("to_rust_type maps primitives and builtins", "[conv]") {
  auto model = test::BuildTestModel();
  const auto& ctx = model.ctx;

  CHECK(to_rust_type("", std::nullopt, ctx).tokens == "()");
  CHECK(to_rust_type("Nil", std::nullopt, ctx).tokens == "()");
  CHECK(to_rust_type("bool", std::nullopt, ctx).tokens == "bool");
  CHECK(to_rust_type("int", std::nullopt, ctx).tokens == "i64");
  CHECK(to_rust_type("int", "int32", ctx).tokens == "i32");
  CHECK(to_rust_type("int", "uint8", ctx).tokens == "u8");
  CHECK(to_rust_type("int", "char32", ctx).tokens == "u32");
  CHECK(to_rust_type("float", std::nullopt, ctx).tokens == "f64");
  CHECK(to_rust_type("float", "float", ctx).tokens == "f32");
  CHECK(to_rust_type("String", std::nullopt, ctx).tokens == "GString");
  CHECK(to_rust_type("Array", std::nullopt, ctx).tokens == "VariantArray");
  CHECK(to_rust_type("Variant", std::nullopt, ctx).tokens == "Variant");
  CHECK(to_rust_type("AABB", std::nullopt, ctx).tokens == "Aabb");
  CHECK(to_rust_type("Vector2i", std::nullopt, ctx).kind == RustTy::Kind::BuiltinIdent);
}

TEST_CASE("to_rust_type maps engine classes, arrays and pointers", "[conv]") {
  auto model = test::BuildTestModel();
  const auto& ctx = model.ctx;

  auto node = to_rust_type("Node", std::nullopt, ctx);
  CHECK(node.kind == RustTy::Kind::EngineClass);
  CHECK(node.tokens == "Gd<crate::classes::Node>");
  CHECK(to_rust_type("Object", std::nullopt, ctx).tokens == "Gd<crate::classes::Object>");

  auto array = to_rust_type("typedarray::Node", std::nullopt, ctx);
  CHECK(array.kind == RustTy::Kind::BuiltinArray);
  CHECK(array.tokens == "Array<Gd<crate::classes::Node>>");

  auto frame = to_rust_type("const AudioFrame*", std::nullopt, ctx);
  CHECK(frame.kind == RustTy::Kind::RawPointer);
  CHECK(frame.tokens == "*const crate::classes::native::AudioFrame");
  CHECK(to_rust_type("uint8_t*", std::nullopt, ctx).tokens == "*mut u8");
  CHECK(to_rust_type("const void*", std::nullopt, ctx).tokens == "*const std::ffi::c_void");
  CHECK(to_rust_type("const uint8_t**", std::nullopt, ctx).tokens == "*const *mut u8");
}

TEST_CASE("to_rust_type maps enum and bitfield references", "[conv]") {
  auto model = test::BuildTestModel();
  const auto& ctx = model.ctx;

  auto global = to_rust_type("enum::Orientation", std::nullopt, ctx);
  CHECK(global.kind == RustTy::Kind::EngineEnum);
  CHECK(global.tokens == "crate::global::Orientation");
  CHECK_FALSE(global.surrounding_class);

  auto variant = to_rust_type("enum::Variant.Type", std::nullopt, ctx);
  CHECK(variant.tokens == "crate::builtin::VariantType");

  auto class_enum = to_rust_type("enum::Node.ProcessMode", std::nullopt, ctx);
  CHECK(class_enum.tokens == "crate::classes::node::ProcessMode");
  CHECK(class_enum.surrounding_class == "Node");

  auto bitfield = to_rust_type("bitfield::Object.ConnectFlags", std::nullopt, ctx);
  CHECK(bitfield.kind == RustTy::Kind::EngineBitfield);
  CHECK(bitfield.tokens == "crate::classes::object::ConnectFlags");
}
