/**
 * @file        tests/unit/codegen/enums_test.cpp
 * @brief       Unit tests for Rust enum and bitfield generation
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <utility>
#include <vector>

#include <gdx/codegen/enums.h>
#include <gdx/codegen/loader.h>

#include "test_api.h"

using namespace gdx::codegen;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

Enum MakeEnum(std::string name, bool is_bitfield, std::vector<std::pair<std::string, int64_t>> values,
              std::optional<std::string_view> surrounding_class = std::nullopt) {
  JsonEnum json;
  json.name = std::move(name);
  json.is_bitfield = is_bitfield;
  for (auto& [value_name, value] : values) {
    json.values.push_back(JsonEnumConstant{value_name, value, {}});
  }
  auto mapped = MapEnum(json, surrounding_class);
  REQUIRE(mapped);
  return std::move(*mapped);
}

size_t CountOccurrences(const std::string& haystack, std::string_view needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

}  // namespace

// =============================================================================
// Non-exhaustive enums
// =============================================================================

TEST_CASE("enumerators sharing an ordinal become aliasing constants", "[enums]") {
  auto e = MakeEnum("Test", false, {{"FOO", 5}, {"BAR", 5}});
  auto code = make_enum_definition(e);

  CHECK_THAT(code, StartsWith("#[repr(transparent)]\n#[derive(Copy, Clone, Eq, PartialEq, Hash)]\npub struct Test {\n"
                              "    ord: i32,\n}\n"));
  CHECK_THAT(code, ContainsSubstring("    pub const FOO: Test = Test { ord: 5 };\n"
                                     "    pub const BAR: Test = Test { ord: 5 };\n"));
  CHECK_THAT(code, ContainsSubstring("impl crate::obj::EngineEnum for Test {\n"
                                     "    fn try_from_ord(ord: i32) -> Option<Self> {\n"
                                     "        match ord {\n"
                                     "            ord @ 5 => Some(Self { ord }),\n"
                                     "            _ => None,\n"
                                     "        }\n"
                                     "    }\n"));
  CHECK_THAT(code, ContainsSubstring("fn ord(self) -> i32 {\n        self.ord\n    }"));
  CHECK_THAT(code, ContainsSubstring("Self::FOO => \"FOO\","));
  CHECK_THAT(code, ContainsSubstring("Self::BAR => \"BAR\","));
  CHECK_THAT(code, ContainsSubstring("f.debug_struct(\"Test\")"));
  CHECK(code.find("IndexEnum") == std::string::npos);
  CHECK(code.find("BitOr") == std::string::npos);
}

TEST_CASE("the first declared enumerator names a shared ordinal", "[enums]") {
  auto e = MakeEnum("Mode", false, {{"MODE_FOO", 5}, {"MODE_BAR", 5}});
  auto code = make_enum_definition(e);

  auto as_str = code.find("fn as_str(&self)");
  auto godot_name = code.find("fn godot_name(&self)");
  REQUIRE(as_str != std::string::npos);
  REQUIRE(godot_name != std::string::npos);

  auto foo_str = code.find("Self::FOO => \"FOO\",", as_str);
  auto bar_str = code.find("Self::BAR => \"BAR\",", as_str);
  REQUIRE(foo_str != std::string::npos);
  REQUIRE(bar_str != std::string::npos);
  CHECK(foo_str < bar_str);
  CHECK(bar_str < godot_name);

  auto foo_godot = code.find("Self::FOO => \"MODE_FOO\",", godot_name);
  auto bar_godot = code.find("Self::BAR => \"MODE_BAR\",", godot_name);
  REQUIRE(foo_godot != std::string::npos);
  REQUIRE(bar_godot != std::string::npos);
  CHECK(foo_godot < bar_godot);
}

TEST_CASE("try_from_ord lists each distinct ordinal once in ascending order", "[enums]") {
  auto e = MakeEnum("InlineAlignment", false,
                    {{"INLINE_ALIGNMENT_TOP_TO", 0}, {"INLINE_ALIGNMENT_CENTER_TO", 1},
                     {"INLINE_ALIGNMENT_TO_TOP", 0}, {"INLINE_ALIGNMENT_TOP", 0}});
  auto code = make_enum_definition(e);
  CHECK_THAT(code, ContainsSubstring("ord @ 0 | ord @ 1 => Some(Self { ord }),"));
  CHECK_THAT(code, ContainsSubstring("pub const TOP_TO: InlineAlignment = InlineAlignment { ord: 0 };"));
  CHECK_THAT(code, ContainsSubstring("#[doc(alias = \"INLINE_ALIGNMENT_TOP\")]"));
}

TEST_CASE("an enum without enumerators accepts no ordinal", "[enums]") {
  auto e = MakeEnum("Empty", false, {});
  auto code = make_enum_definition(e);
  CHECK_THAT(code, ContainsSubstring("match ord {\n            _ => None,\n        }"));
}

TEST_CASE("renamed enumerators keep their Godot names", "[enums]") {
  auto e = MakeEnum("ProcessMode", false, {{"PROCESS_MODE_INHERIT", 0}, {"PROCESS_MODE_ALWAYS", 3}}, "Node");
  auto code = make_enum_definition(e);

  CHECK_THAT(code, ContainsSubstring("    #[doc(alias = \"PROCESS_MODE_INHERIT\")]\n"
                                     "    /// Godot enumerator name: `PROCESS_MODE_INHERIT`\n"
                                     "    pub const INHERIT: ProcessMode = ProcessMode { ord: 0 };\n"));
  CHECK_THAT(code, ContainsSubstring("fn godot_name(&self) -> &'static str {"));
  CHECK_THAT(code, ContainsSubstring("Self::ALWAYS => \"PROCESS_MODE_ALWAYS\","));
  CHECK_THAT(code, ContainsSubstring("_ => self.as_str(),"));
}

TEST_CASE("index enums implement IndexEnum", "[enums]") {
  auto e = MakeEnum("ArrayType", false, {{"ARRAY_VERTEX", 0}, {"ARRAY_NORMAL", 1}, {"ARRAY_MAX", 2}},
                    "RenderingServer");
  auto code = make_enum_definition(e);
  CHECK_THAT(code, ContainsSubstring("impl crate::obj::IndexEnum for ArrayType {\n"
                                     "    const ENUMERATOR_COUNT: usize = 2;\n"
                                     "}\n"));
}

TEST_CASE("index enums tolerate aliased ordinals", "[enums]") {
  auto e = MakeEnum("Slot", false, {{"SLOT_A", 0}, {"SLOT_A_ALIAS", 0}, {"SLOT_B", 1}, {"SLOT_MAX", 2}});
  CHECK(e.find_index_enum_max() == 2u);

  auto code = make_enum_definition(e);
  CHECK_THAT(code, ContainsSubstring("impl crate::obj::IndexEnum for Slot {\n"
                                     "    const ENUMERATOR_COUNT: usize = 2;\n"
                                     "}\n"));
}

TEST_CASE("enums with gaps or without a MAX sentinel are not index enums", "[enums]") {
  SECTION("gap below the sentinel") {
    auto e = MakeEnum("Slot", false, {{"SLOT_A", 0}, {"SLOT_C", 2}, {"SLOT_MAX", 3}});
    CHECK_FALSE(e.find_index_enum_max());
  }

  SECTION("ordinals not starting at zero") {
    auto e = MakeEnum("Slot", false, {{"SLOT_A", 1}, {"SLOT_B", 2}, {"SLOT_MAX", 3}});
    CHECK_FALSE(e.find_index_enum_max());
  }

  SECTION("sentinel past the last ordinal") {
    auto e = MakeEnum("Slot", false, {{"SLOT_A", 0}, {"SLOT_A_ALIAS", 0}, {"SLOT_MAX", 2}});
    CHECK_FALSE(e.find_index_enum_max());
  }

  SECTION("no sentinel") {
    auto e = MakeEnum("Slot", false, {{"SLOT_A", 0}, {"SLOT_B", 1}, {"SLOT_C", 2}});
    CHECK_FALSE(e.find_index_enum_max());
    CHECK(make_enum_definition(e).find("IndexEnum") == std::string::npos);
  }
}

// =============================================================================
// Exhaustive enums
// =============================================================================

TEST_CASE("exhaustive enums become Rust enums", "[enums]") {
  auto e = MakeEnum("Orientation", false, {{"VERTICAL", 1}, {"HORIZONTAL", 0}});
  REQUIRE(e.is_exhaustive);

  SECTION("type definition") {
    auto code = make_enum_definition_with(e, true, false);
    CHECK(code ==
          "#[repr(i32)]\n"
          "#[derive(Debug, Copy, Clone, Eq, PartialEq, Hash)]\n"
          "///\n"
          "/// This enum is exhaustive; you should not expect future Godot versions to add new enumerators.\n"
          "#[allow(non_camel_case_types)]\n"
          "pub enum Orientation {\n"
          "    VERTICAL = 1,\n"
          "    HORIZONTAL = 0,\n"
          "}\n"
          "\n");
  }
  SECTION("traits") {
    auto code = make_enum_definition(e);
    CHECK_THAT(code, ContainsSubstring("            1 => Some(Self::VERTICAL),\n"
                                       "            0 => Some(Self::HORIZONTAL),\n"
                                       "            _ => None,\n"));
    CHECK_THAT(code, ContainsSubstring("fn ord(self) -> i32 {\n        self as i32\n    }"));
    CHECK_THAT(code, ContainsSubstring("fn godot_name(&self) -> &'static str {\n        self.as_str()\n    }"));
    CHECK(code.find("impl std::fmt::Debug") == std::string::npos);
  }
}

// =============================================================================
// Bitfields
// =============================================================================

TEST_CASE("bitfields combine with BitOr", "[enums]") {
  auto e = MakeEnum("Flags", true, {{"A", 1}, {"B", 2}});
  auto code = make_enum_definition(e);

  CHECK_THAT(code, ContainsSubstring("#[derive(Copy, Clone, Eq, PartialEq, Hash, Default)]\npub struct Flags {\n"
                                     "    ord: u64,\n}"));
  CHECK_THAT(code, ContainsSubstring("pub const A: Flags = Flags { ord: 1 };"));
  CHECK_THAT(code, ContainsSubstring("pub const B: Flags = Flags { ord: 2 };"));
  CHECK_THAT(code, ContainsSubstring("impl crate::obj::EngineBitfield for Flags {\n"
                                     "    fn try_from_ord(ord: u64) -> Option<Self> {\n"
                                     "        Some(Self { ord })\n"
                                     "    }\n"));
  CHECK_THAT(code, ContainsSubstring("impl std::ops::BitOr for Flags {\n    type Output = Self;\n"));
  CHECK_THAT(code, ContainsSubstring("Self { ord: self.ord | rhs.ord }"));
  CHECK_THAT(code, ContainsSubstring("let enumerator = match *self {"));
  CHECK_THAT(code, ContainsSubstring("type Via = u64;"));
  CHECK_THAT(code, ContainsSubstring("<Self as crate::obj::EngineBitfield>::try_from_ord(via)"));
  CHECK(code.find("IndexEnum") == std::string::npos);
}

TEST_CASE("bitfield Debug names a shared value after the first declared flag", "[enums]") {
  auto e = MakeEnum("Flags", true, {{"FLAG_A", 1}, {"FLAG_ALIAS", 1}, {"FLAG_B", 2}});
  auto code = make_enum_definition(e);

  auto debug = code.find("impl std::fmt::Debug for Flags {");
  REQUIRE(debug != std::string::npos);
  CHECK(code.find("fn as_str(&self)") == std::string::npos);

  auto match = code.find("let enumerator = match *self {", debug);
  REQUIRE(match != std::string::npos);
  CHECK_THAT(code.substr(match), StartsWith("let enumerator = match *self {\n"
                                            "            Self::A => \"A\",\n"
                                            "            Self::ALIAS => \"ALIAS\",\n"
                                            "            Self::B => \"B\",\n"));
  CHECK_THAT(code, ContainsSubstring("#[allow(unreachable_patterns)]\n        let enumerator = match *self {"));
}

TEST_CASE("Key combines with KeyModifierMask", "[enums]") {
  auto e = MakeEnum("Key", false, {{"KEY_NONE", 0}, {"KEY_A", 65}});
  auto code = make_enum_definition(e);

  CHECK_THAT(code, ContainsSubstring("impl std::ops::BitOr<crate::global::KeyModifierMask> for Key {"));
  CHECK_THAT(code, ContainsSubstring("impl std::ops::BitOr<Key> for crate::global::KeyModifierMask {\n"
                                     "    type Output = Key;\n"));
  CHECK_THAT(code, ContainsSubstring("impl std::ops::BitOrAssign<crate::global::KeyModifierMask> for Key {"));
  CHECK_THAT(code, ContainsSubstring("i32::try_from(rhs.ord)"));
}

// =============================================================================
// Attributes and collections
// =============================================================================

TEST_CASE("item attributes precede every top-level item", "[enums]") {
  auto e = MakeEnum("Test", false, {{"FOO", 5}, {"BAR", 5}});
  const std::string cfg = "#[cfg(feature = \"experimental-godot-api\")]";
  auto code = make_enum_definition_with(e, true, true, cfg);

  CHECK_THAT(code, StartsWith(cfg + "\n#[repr(transparent)]\n"));
  CHECK_THAT(code, ContainsSubstring(cfg + "\nimpl Test {\n"));
  CHECK_THAT(code, ContainsSubstring(cfg + "\nimpl crate::obj::EngineEnum for Test {\n"));
  CHECK_THAT(code, ContainsSubstring(cfg + "\nimpl crate::meta::FromGodot for Test {\n"));
  // struct, inherent impl, Debug, EngineEnum, GodotConvert, ToGodot, FromGodot
  CHECK(CountOccurrences(code, cfg) == 7);
}

TEST_CASE("traits can be emitted without the type definition", "[enums]") {
  auto e = MakeEnum("Test", false, {{"FOO", 5}});
  auto code = make_enum_definition_with(e, false, true);
  CHECK(code.find("pub struct Test") == std::string::npos);
  CHECK_THAT(code, StartsWith("impl crate::obj::EngineEnum for Test {"));

  auto type_only = make_enum_definition_with(e, true, false);
  CHECK_THAT(type_only, ContainsSubstring("    #[doc(hidden)]\n    pub ord: i32,\n"));
  CHECK(type_only.find("EngineEnum for") == std::string::npos);
}

TEST_CASE("make_enums concatenates definitions", "[enums]") {
  std::vector<Enum> enums = {
      MakeEnum("First", false, {{"FIRST_A", 0}, {"FIRST_B", 1}}),
      MakeEnum("Second", true, {{"SECOND_A", 1}, {"SECOND_B", 2}}),
  };
  auto code = make_enums(enums, "");
  auto first = code.find("pub struct First");
  auto second = code.find("pub struct Second");
  REQUIRE(first != std::string::npos);
  REQUIRE(second != std::string::npos);
  CHECK(first < second);
}

TEST_CASE("deprecated PascalCase aliases point at the SHOUT_CASE enumerators", "[enums]") {
  auto model = test::BuildTestModel();
  const auto* variant_type = model.api.find_global_enum("VariantType");
  REQUIRE(variant_type != nullptr);

  auto code = make_deprecated_enumerators(*variant_type);
  CHECK_THAT(code, StartsWith("#[deprecated = \"Renamed to `VariantType::NIL`.\"]\n"
                              "#[allow(non_upper_case_globals)]\n"
                              "pub const Nil: VariantType = VariantType::NIL;\n"));
  CHECK_THAT(code, ContainsSubstring("pub const PackedByteArray: VariantType = VariantType::PACKED_BYTE_ARRAY;"));
  CHECK_THAT(code, ContainsSubstring("pub const Vector2i: VariantType = VariantType::VECTOR2I;"));

  auto plain = MakeEnum("Flags", true, {{"A", 1}, {"B", 2}});
  CHECK(make_deprecated_enumerators(plain).empty());
}
