/**
 * @file        tests/unit/core/string_test.cpp
 * @brief       Unit tests for gdx::string helpers
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <gdx/string.h>

using namespace gdx::string;

TEST_CASE("case conversion only touches ASCII letters", "[string]") {
  CHECK(to_lower_ascii("Vector2I_AABB") == "vector2i_aabb");
  CHECK(to_upper_ascii("packed_byte_array") == "PACKED_BYTE_ARRAY");
  CHECK(to_upper_ascii("") == "");
}

TEST_CASE("prefix and suffix checks", "[string]") {
  CHECK(starts_with("typedarray::Node", "typedarray::"));
  CHECK_FALSE(starts_with("enum", "enum::"));
  CHECK(ends_with("const uint8_t*", "*"));
  CHECK(ends_with("ARRAY_MAX", "_MAX"));
  CHECK_FALSE(ends_with("MAX", "_MAX"));
}

TEST_CASE("trim removes surrounding whitespace", "[string]") {
  CHECK(trim("  const void * ") == "const void *");
  CHECK(trim_left("\t\nx ") == "x ");
  CHECK(trim_right(" x\r\n") == " x");
  CHECK(trim("   ").empty());
  CHECK(trim_string("__name__", "_") == "name");
}

TEST_CASE("split keeps empty pieces", "[string]") {
  SECTION("single delimiter") {
    auto parts = split("KEY_MASK_SHIFT", '_');
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "KEY");
    CHECK(parts[2] == "SHIFT");
  }
  SECTION("leading, doubled and trailing delimiters") {
    auto parts = split("_A__B_", '_');
    CHECK(parts == std::vector<std::string_view>{"", "A", "", "B", ""});
  }
  SECTION("no delimiter") {
    auto parts = split("4", '.');
    REQUIRE(parts.size() == 1);
    CHECK(parts[0] == "4");
  }
}

TEST_CASE("join and replace_all", "[string]") {
  CHECK(join({"ord @ 0", "ord @ 1"}, " | ") == "ord @ 0 | ord @ 1");
  CHECK(join({}, ", ").empty());
  CHECK(replace_all("Node2D3D", "D", "d") == "Node2d3d");
  CHECK(replace_all("Variant.Type", ".", "") == "VariantType");
  CHECK(replace_all("abc", "", "x") == "abc");
}
