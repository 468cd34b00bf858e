/**
 * @file        codegen/enums.cpp
 * @brief       Rust definitions for engine enums and bitfields
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/enums.h>
#include <gdx/codegen/code_writer.h>
#include <gdx/codegen/conv.h>
#include <gdx/codegen/special_cases.h>
#include <gdx/logging.h>
#include <gdx/string.h>

#include <set>

#include <fmt/format.h>

namespace gdx::codegen {

namespace {

std::vector<std::string> MakeEnumDoc(const Enum& enum_) {
    std::vector<std::string> docs;
    if (enum_.name != enum_.godot_name) {
        docs.push_back(fmt::format("Godot enum name: `{}`.", enum_.godot_name));
    }
    return docs;
}

void WriteEnumeratorDocs(CodeWriter& w, const Enumerator& enumerator) {
    if (enumerator.name != enumerator.godot_name) {
        w.println("#[doc(alias = \"{}\")]", enumerator.godot_name);
        w.println("/// Godot enumerator name: `{}`", enumerator.godot_name);
    }
}

void WriteEnumeratorDefinition(CodeWriter& w, const Enumerator& enumerator, std::string_view enum_name,
                               bool as_constant) {
    WriteEnumeratorDocs(w, enumerator);
    if (as_constant) {
        w.println("pub const {}: {} = {} {{ ord: {} }};", enumerator.name, enum_name, enum_name,
                  enumerator.value.to_literal());
    } else {
        w.println("{} = {},", enumerator.name, enumerator.value.to_literal());
    }
}

void WriteToStrCases(CodeWriter& w, const Enum& enum_) {
    for (const auto& enumerator : enum_.enumerators) {
        w.println("Self::{} => \"{}\",", enumerator.name, enumerator.name);
    }
}

// Falls back to `Name { ord: N }` for values without a named enumerator.
void WriteEnumeratorNotFound(CodeWriter& w, const Enum& enum_) {
    w.println("f.debug_struct(\"{}\")", enum_.name);
    w.indent();
    w.println(".field(\"ord\", &self.ord)");
    w.println(".finish()?;");
    w.dedent();
    w.println();
    w.println("return Ok(());");
}

void WriteDebugImpl(CodeWriter& w, const Enum& enum_, bool use_as_str, std::string_view attrs) {
    w.append(attrs);
    w.open(fmt::format("impl std::fmt::Debug for {}", enum_.name));
    w.open("fn fmt(&self, f: &mut std::fmt::Formatter<'_>) -> std::fmt::Result");

    if (use_as_str) {
        w.println("use crate::obj::EngineEnum;");
        w.println();
        w.println("let enumerator = self.as_str();");
        w.open("if enumerator.is_empty()");
        WriteEnumeratorNotFound(w, enum_);
        w.close();
    } else {
        w.println("#[allow(unreachable_patterns)]");
        w.open("let enumerator = match *self");
        WriteToStrCases(w, enum_);
        w.open("_ =>");
        WriteEnumeratorNotFound(w, enum_);
        w.close();
        w.close(";");
    }

    w.println("f.write_str(enumerator)");
    w.close();
    w.close();
    w.println();
}

void WriteStrFunctions(CodeWriter& w, const Enum& enum_) {
    w.println("#[inline]");
    w.open("fn as_str(&self) -> &'static str");
    w.println("#[allow(unreachable_patterns)]");
    w.open("match *self");
    WriteToStrCases(w, enum_);
    w.println("_ => \"\",");
    w.close();
    w.close();
    w.println();

    bool any_different = false;
    for (const auto& enumerator : enum_.enumerators) {
        any_different = any_different || enumerator.name != enumerator.godot_name;
    }

    w.open("fn godot_name(&self) -> &'static str");
    if (!any_different) {
        w.println("self.as_str()");
    } else {
        w.println("#[allow(unreachable_patterns)]");
        w.open("match *self");
        for (const auto& enumerator : enum_.enumerators) {
            if (enumerator.name != enumerator.godot_name) {
                w.println("Self::{} => \"{}\",", enumerator.name, enumerator.godot_name);
            }
        }
        w.println("_ => self.as_str(),");
        w.close();
    }
    w.close();
}

void WriteEngineTraitImpl(CodeWriter& w, const Enum& enum_, std::string_view attrs) {
    w.append(attrs);
    w.open(fmt::format("impl {} for {}", enum_.engine_trait(), enum_.name));

    if (enum_.is_bitfield) {
        w.open("fn try_from_ord(ord: u64) -> Option<Self>");
        w.println("Some(Self {{ ord }})");
        w.close();
        w.println();
        w.open("fn ord(self) -> u64");
        w.println("self.ord");
        w.close();
    } else if (enum_.is_exhaustive) {
        w.open("fn try_from_ord(ord: i32) -> Option<Self>");
        w.open("match ord");
        for (const auto& enumerator : enum_.enumerators) {
            if (enumerator.value.is_bitfield()) {
                GDX_FATAL("exhaustive enum {} contains bitfield enumerators", enum_.name);
            }
            w.println("{} => Some(Self::{}),", enumerator.value.ord(), enumerator.name);
        }
        w.println("_ => None,");
        w.close();
        w.close();
        w.println();
        w.open("fn ord(self) -> i32");
        w.println("self as i32");
        w.close();
        w.println();
        WriteStrFunctions(w, enum_);
    } else {
        auto unique_ords = enum_.unique_ords();
        w.open("fn try_from_ord(ord: i32) -> Option<Self>");
        w.open("match ord");
        if (!unique_ords.empty()) {
            std::vector<std::string> patterns;
            patterns.reserve(unique_ords.size());
            for (int32_t ord : unique_ords) {
                patterns.push_back(fmt::format("ord @ {}", ord));
            }
            w.println("{} => Some(Self {{ ord }}),", string::join(patterns, " | "));
        }
        w.println("_ => None,");
        w.close();
        w.close();
        w.println();
        w.open("fn ord(self) -> i32");
        w.println("self.ord");
        w.close();
        w.println();
        WriteStrFunctions(w, enum_);
    }

    w.close();
    w.println();
}

void WriteIndexImpl(CodeWriter& w, const Enum& enum_, std::string_view attrs) {
    auto enum_max = enum_.find_index_enum_max();
    if (!enum_max) {
        return;
    }

    w.append(attrs);
    w.open(fmt::format("impl crate::obj::IndexEnum for {}", enum_.name));
    w.println("const ENUMERATOR_COUNT: usize = {};", *enum_max);
    w.close();
    w.println();
}

void WriteBitwiseOperators(CodeWriter& w, const Enum& enum_, std::string_view attrs) {
    const auto& name = enum_.name;

    if (enum_.is_bitfield) {
        w.append(attrs);
        w.open(fmt::format("impl std::ops::BitOr for {}", name));
        w.println("type Output = Self;");
        w.println();
        w.println("#[inline]");
        w.open("fn bitor(self, rhs: Self) -> Self::Output");
        w.println("Self {{ ord: self.ord | rhs.ord }}");
        w.close();
        w.close();
        w.println();
        return;
    }

    auto mask_enum = special_cases::as_enum_bitmaskable(enum_);
    if (!mask_enum) {
        return;
    }
    if (mask_enum->kind != RustTy::Kind::EngineEnum && mask_enum->kind != RustTy::Kind::EngineBitfield) {
        GDX_FATAL("as_enum_bitmaskable() must return an enum or bitfield type for {}", name);
    }
    const auto& mask = mask_enum->tokens;

    w.append(attrs);
    w.open(fmt::format("impl std::ops::BitOr<{}> for {}", mask, name));
    w.println("type Output = Self;");
    w.println();
    w.println("#[inline]");
    w.open(fmt::format("fn bitor(self, rhs: {}) -> Self::Output", mask));
    w.println("Self {{ ord: self.ord | i32::try_from(rhs.ord).expect(\"masking bitfield outside integer range\") }}");
    w.close();
    w.close();
    w.println();

    w.append(attrs);
    w.open(fmt::format("impl std::ops::BitOr<{}> for {}", name, mask));
    w.println("type Output = {};", name);
    w.println();
    w.println("#[inline]");
    w.open(fmt::format("fn bitor(self, rhs: {}) -> Self::Output", name));
    w.println("rhs | self");
    w.close();
    w.close();
    w.println();

    w.append(attrs);
    w.open(fmt::format("impl std::ops::BitOrAssign<{}> for {}", mask, name));
    w.println("#[inline]");
    w.open(fmt::format("fn bitor_assign(&mut self, rhs: {})", mask));
    w.println("*self = *self | rhs;");
    w.close();
    w.close();
    w.println();
}

void WriteConversionTraits(CodeWriter& w, const Enum& enum_, std::string_view attrs) {
    const auto& name = enum_.name;
    auto ord_type = enum_.ord_type();
    auto engine_trait = enum_.engine_trait();

    w.append(attrs);
    w.open(fmt::format("impl crate::meta::GodotConvert for {}", name));
    w.println("type Via = {};", ord_type);
    w.close();
    w.println();

    w.append(attrs);
    w.open(fmt::format("impl crate::meta::ToGodot for {}", name));
    w.println("type ToVia<'v> = {};", ord_type);
    w.println();
    w.open("fn to_godot(&self) -> Self::ToVia<'_>");
    w.println("<Self as {}>::ord(*self)", engine_trait);
    w.close();
    w.close();
    w.println();

    w.append(attrs);
    w.open(fmt::format("impl crate::meta::FromGodot for {}", name));
    w.open("fn try_from_godot(via: Self::Via) -> std::result::Result<Self, crate::meta::error::ConvertError>");
    w.println("<Self as {}>::try_from_ord(via)", engine_trait);
    w.indent();
    w.println(".ok_or_else(|| crate::meta::error::FromGodotError::InvalidEnum.into_error(via))");
    w.dedent();
    w.close();
    w.close();
    w.println();
}

void WriteTypeDefinition(CodeWriter& w, const Enum& enum_, bool define_traits, std::string_view attrs) {
    auto derives = enum_.derives();
    std::vector<std::string> derive_names(derives.begin(), derives.end());
    const auto& name = enum_.name;

    if (enum_.is_exhaustive) {
        w.append(attrs);
        w.println("#[repr(i32)]");
        w.println("#[derive(Debug, {})]", string::join(derive_names, ", "));
        for (const auto& doc : MakeEnumDoc(enum_)) {
            w.println("/// {}", doc);
        }
        w.println("///");
        w.println("/// This enum is exhaustive; you should not expect future Godot versions to add new enumerators.");
        w.println("#[allow(non_camel_case_types)]");
        w.open(fmt::format("pub enum {}", name));
        for (const auto& enumerator : enum_.enumerators) {
            WriteEnumeratorDefinition(w, enumerator, name, false);
        }
        w.close();
        w.println();
        return;
    }

    w.append(attrs);
    w.println("#[repr(transparent)]");
    w.println("#[derive({})]", string::join(derive_names, ", "));
    for (const auto& doc : MakeEnumDoc(enum_)) {
        w.println("/// {}", doc);
    }
    w.open(fmt::format("pub struct {}", name));
    if (!define_traits) {
        // Read by the crate that implements the traits.
        w.println("#[doc(hidden)]");
        w.println("pub ord: {},", enum_.ord_type());
    } else {
        w.println("ord: {},", enum_.ord_type());
    }
    w.close();
    w.println();

    w.append(attrs);
    w.open(fmt::format("impl {}", name));
    for (const auto& enumerator : enum_.enumerators) {
        WriteEnumeratorDefinition(w, enumerator, name, true);
    }
    w.close();
    w.println();

    WriteDebugImpl(w, enum_, define_traits && !enum_.is_bitfield, attrs);
}

}  // namespace

std::string make_enum_definition(const Enum& enum_) { return make_enum_definition_with(enum_, true, true); }

std::string make_enum_definition_with(const Enum& enum_, bool define_enum, bool define_traits,
                                      std::string_view item_attributes) {
    if (enum_.is_bitfield && enum_.is_exhaustive) {
        GDX_FATAL("bitfield {} cannot be marked exhaustive", enum_.name);
    }

    std::string attrs(item_attributes);
    if (!attrs.empty() && attrs.back() != '\n') {
        attrs.push_back('\n');
    }

    CodeWriter w;
    if (define_enum) {
        WriteTypeDefinition(w, enum_, define_traits, attrs);
    }
    if (define_traits) {
        WriteEngineTraitImpl(w, enum_, attrs);
        WriteIndexImpl(w, enum_, attrs);
        WriteBitwiseOperators(w, enum_, attrs);
        WriteConversionTraits(w, enum_, attrs);
    }
    return w.take();
}

std::string make_enums(const std::vector<Enum>& enums, std::string_view cfg_attributes) {
    std::string out;
    for (const auto& enum_ : enums) {
        out += make_enum_definition_with(enum_, true, true, cfg_attributes);
    }
    return out;
}

std::string make_deprecated_enumerators(const Enum& enum_) {
    CodeWriter w;
    std::set<std::string> emitted;

    for (const auto& enumerator : enum_.enumerators) {
        auto pascal_name = conv::shout_to_pascal(enumerator.name);
        if (pascal_name.empty() || pascal_name == enumerator.name || !emitted.insert(pascal_name).second) {
            continue;
        }

        w.println("#[deprecated = \"Renamed to `{}::{}`.\"]", enum_.name, enumerator.name);
        w.println("#[allow(non_upper_case_globals)]");
        w.println("pub const {}: {} = {}::{};", pascal_name, enum_.name, enum_.name, enumerator.name);
    }
    return w.take();
}

}  // namespace gdx::codegen
