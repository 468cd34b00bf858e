/**
 * @file        codegen/central_files.cpp
 * @brief       Central sys/core files: opaque types, build info, variant tags
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/central_files.h>
#include <gdx/codegen/code_writer.h>
#include <gdx/codegen/context.h>
#include <gdx/codegen/conv.h>
#include <gdx/codegen/enums.h>
#include <gdx/logging.h>

#include <array>
#include <vector>

#include <fmt/format.h>

namespace gdx::codegen {

namespace {

constexpr std::string_view kVariantTypeName = "VariantType";

struct VariantEnums {
    std::vector<std::string> pascal;
    std::vector<std::string> shout;
    std::vector<std::string> rust;
};

const Enum& FindVariantTypeEnum(const ExtensionApi& api) {
    const Enum* variant_type = api.find_global_enum(kVariantTypeName);
    if (!variant_type) {
        // The loader rejects documents without Variant.Type.
        GDX_FATAL("missing VariantType enum in API model");
    }
    return *variant_type;
}

std::string MakeOpaqueType(std::string_view godot_original_name, size_t size) {
    auto name = conv::to_pascal_case(godot_original_name);
    return fmt::format("pub type Opaque{} = crate::opaque::Opaque<{}>;", name, size);
}

// Index 0 holds 32-bit definitions, index 1 the 64-bit ones.
std::array<std::vector<std::string>, 2> MakeOpaqueTypes(const ExtensionApi& api) {
    std::array<std::vector<std::string>, 2> opaque_types;
    for (const auto& b : api.builtin_sizes) {
        size_t index = Is64Bit(b.config) ? 1 : 0;
        opaque_types[index].push_back(MakeOpaqueType(b.builtin_original_name, b.size));
    }
    return opaque_types;
}

VariantEnums MakeVariantEnums(const ExtensionApi& api, const Context& ctx) {
    VariantEnums result;
    result.pascal.reserve(api.builtins.size());
    result.shout.reserve(api.builtins.size());
    result.rust.reserve(api.builtins.size());

    // NIL is not part of the builtin list; the dispatch emits it separately.
    for (const auto& builtin : api.builtins) {
        const auto& original_name = builtin.godot_original_name;
        result.pascal.push_back(conv::to_pascal_case(original_name));
        result.shout.push_back(builtin.godot_shout_name);
        result.rust.push_back(conv::to_rust_type(original_name, std::nullopt, ctx).tokens);
    }
    return result;
}

void WriteGlobalConstants(CodeWriter& w, const ExtensionApi& api) {
    for (const auto& constant : api.global_constants) {
        w.println("pub const {}: i64 = {};", conv::safe_ident(constant.name), constant.value);
    }
    if (!api.global_constants.empty()) {
        w.println();
    }
}

}  // namespace

std::string escape_rust_string(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string make_gdext_build_struct(const GodotApiVersion& version, Precision precision) {
    bool is_double = precision == Precision::Double;
    std::string full_name = version.full_name.empty()
                                ? fmt::format("Godot Engine v{}.{}.{}", version.major, version.minor, version.patch)
                                : version.full_name;

    CodeWriter w;
    w.println("pub struct GdextBuild;");
    w.println();
    w.open("impl GdextBuild");

    w.println("/// Godot version against which the bindings were generated.");
    w.println("///");
    w.println("/// Example format: `(4, 1, 1)`");
    w.open("pub const fn godot_static_version_triple() -> (u8, u8, u8)");
    w.println("({}, {}, {})", version.major, version.minor, version.patch);
    w.close();
    w.println();

    w.println("/// Godot version against which the bindings were generated, as a human-readable string.");
    w.open("pub const fn godot_static_version_string() -> &'static str");
    w.println("\"{}\"", escape_rust_string(full_name));
    w.close();
    w.println();

    w.println("/// Build configuration the opaque type sizes were taken from.");
    w.open("pub const fn build_configuration() -> &'static str");
    w.open("if cfg!(target_pointer_width = \"64\")");
    w.println("\"{}\"", BuildConfigName(MakeBuildConfig(precision, true)));
    w.dedent();
    w.open("} else");
    w.println("\"{}\"", BuildConfigName(MakeBuildConfig(precision, false)));
    w.close();
    w.close();
    w.println();

    w.open("pub const fn is_double_precision() -> bool");
    w.println("{}", is_double ? "true" : "false");
    w.close();
    w.println();

    w.println("/// For a string \"4.x\", returns `true` if the static Godot version is strictly less than 4.x.");
    w.println("///");
    w.println("/// Runtime equivalent of `#[cfg(before_api = \"4.x\")]`.");
    w.open("pub fn before_api(major_minor: &str) -> bool");
    w.println("let mut parts = major_minor.split('.');");
    w.println("let queried_major = parts.next().unwrap().parse::<u8>().expect(\"invalid major version\");");
    w.println("let queried_minor = parts.next().unwrap().parse::<u8>().expect(\"invalid minor version\");");
    w.println("assert_eq!(queried_major, 4, \"major version must be 4\");");
    w.println();
    w.println("let (_, minor, _) = Self::godot_static_version_triple();");
    w.println("minor < queried_minor");
    w.close();
    w.println();

    w.println("/// For a string \"4.x\", returns `true` if the static Godot version is equal to or greater than 4.x.");
    w.println("///");
    w.println("/// Runtime equivalent of `#[cfg(since_api = \"4.x\")]`.");
    w.open("pub fn since_api(major_minor: &str) -> bool");
    w.println("!Self::before_api(major_minor)");
    w.close();

    w.close();
    w.println();
    return w.take();
}

std::string make_sys_central_code(const ExtensionApi& api) {
    const Enum& variant_type = FindVariantTypeEnum(api);
    auto [opaque_32bit, opaque_64bit] = MakeOpaqueTypes(api);

    CodeWriter w;
    w.println("#[cfg(target_pointer_width = \"32\")]");
    w.open("pub mod types");
    for (const auto& def : opaque_32bit) {
        w.println("{}", def);
    }
    w.close();
    w.println("#[cfg(target_pointer_width = \"64\")]");
    w.open("pub mod types");
    for (const auto& def : opaque_64bit) {
        w.println("{}", def);
    }
    w.close();
    w.println();
    w.println("// ----------------------------------------------------------------------------------------------------------------------------------------------");
    w.println();

    w.append(make_gdext_build_struct(api.godot_version, api.precision));
    w.append(make_enum_definition_with(variant_type, true, false));

    w.open("impl VariantType");
    w.println("#[doc(hidden)]");
    w.open("pub fn from_sys(enumerator: crate::GDExtensionVariantType) -> Self");
    w.println("Self {{ ord: enumerator as i32 }}");
    w.close();
    w.println();
    w.println("#[doc(hidden)]");
    w.open("pub fn sys(self) -> crate::GDExtensionVariantType");
    w.println("self.ord as _");
    w.close();

    auto deprecated = make_deprecated_enumerators(variant_type);
    if (!deprecated.empty()) {
        w.println();
        w.append(deprecated);
    }
    w.close();

    return w.take();
}

std::string make_core_central_code(const ExtensionApi& api, const Context& ctx) {
    const Enum& variant_type = FindVariantTypeEnum(api);
    auto variants = MakeVariantEnums(api, ctx);

    CodeWriter w;
    w.println("use crate::builtin::*;");
    w.println("use crate::classes::Object;");
    w.println("use crate::obj::Gd;");
    w.println();

    w.println("// Remaining trait impls for sys::VariantType; the type itself is defined in the sys crate.");
    w.append(make_enum_definition_with(variant_type, false, true));

    w.println("#[allow(dead_code)]");
    w.open("pub enum VariantDispatch");
    w.println("Nil,");
    for (size_t i = 0; i < variants.pascal.size(); ++i) {
        w.println("{}({}),", variants.pascal[i], variants.rust[i]);
    }
    w.close();
    w.println();

    w.open("impl VariantDispatch");
    w.open("pub fn from_variant(variant: &Variant) -> Self");
    w.open("match variant.get_type()");
    w.println("VariantType::NIL => Self::Nil,");
    for (size_t i = 0; i < variants.pascal.size(); ++i) {
        w.println("VariantType::{} => Self::{}(variant.to::<{}>()),", variants.shout[i], variants.pascal[i],
                  variants.rust[i]);
    }
    w.println();
    w.println("_ => panic!(\"Variant type not supported: {{:?}}\", variant.get_type()),");
    w.close();
    w.close();
    w.close();
    w.println();

    w.open("impl std::fmt::Debug for VariantDispatch");
    w.open("fn fmt(&self, f: &mut std::fmt::Formatter<'_>) -> std::fmt::Result");
    w.open("match self");
    w.println("Self::Nil => write!(f, \"null\"),");
    for (const auto& pascal : variants.pascal) {
        w.println("Self::{}(v) => write!(f, \"{{v:?}}\"),", pascal);
    }
    w.close();
    w.close();
    w.close();
    w.println();

    std::string global_defs;
    std::string reexported_defs;
    for (const auto& enum_ : api.global_enums) {
        if (enum_.name == kVariantTypeName) {
            continue;
        }
        auto def = make_enum_definition(enum_);
        if (enum_.is_private) {
            reexported_defs += def;
        } else {
            global_defs += def;
        }
    }

    w.println("/// Global enums and constants, generated by Godot.");
    w.open("pub mod global_enums");
    w.println("use crate::sys;");
    w.println();
    WriteGlobalConstants(w, api);
    w.append(global_defs);
    w.close();
    w.println();

    w.open("pub mod global_reexported_enums");
    w.println("use crate::sys;");
    w.println();
    w.append(reexported_defs);
    w.close();

    return w.take();
}

}  // namespace gdx::codegen
