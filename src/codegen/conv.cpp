/**
 * @file        codegen/conv.cpp
 * @brief       Identifier case conversion and Godot-to-Rust type mapping
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/conv.h>
#include <gdx/codegen/context.h>
#include <gdx/logging.h>
#include <gdx/string.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <utility>

#include <fmt/format.h>

namespace gdx::codegen::conv {

namespace {

bool IsUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool IsLower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool IsAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

enum class WordMode { Boundary, Lowercase, Uppercase };

/**
 * Split an identifier into words.
 *
 * Separators are non-alphanumeric characters, lower-to-upper transitions
 * (`nodePath`) and the last capital of an acronym (`HTTPRequest`). Digits
 * stick to the preceding word.
 */
std::vector<std::string> SplitWords(std::string_view name) {
    std::vector<std::string> words;

    size_t pos = 0;
    while (pos < name.size()) {
        while (pos < name.size() && !IsAlnum(name[pos])) {
            ++pos;
        }
        size_t end = pos;
        while (end < name.size() && IsAlnum(name[end])) {
            ++end;
        }
        if (end == pos) {
            break;
        }

        std::string_view segment = name.substr(pos, end - pos);
        size_t init = 0;
        WordMode mode = WordMode::Boundary;
        for (size_t i = 0; i < segment.size(); ++i) {
            char c = segment[i];
            if (i + 1 == segment.size()) {
                words.emplace_back(segment.substr(init));
                break;
            }

            char next = segment[i + 1];
            WordMode next_mode = IsLower(c) ? WordMode::Lowercase : IsUpper(c) ? WordMode::Uppercase : mode;

            if (next_mode == WordMode::Lowercase && IsUpper(next)) {
                words.emplace_back(segment.substr(init, i + 1 - init));
                init = i + 1;
                mode = WordMode::Boundary;
            } else if (mode == WordMode::Uppercase && IsUpper(c) && IsLower(next)) {
                words.emplace_back(segment.substr(init, i - init));
                init = i;
                mode = WordMode::Boundary;
            } else {
                mode = next_mode;
            }
        }
        pos = end;
    }

    return words;
}

std::string PascalFromWords(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        auto lower = string::to_lower_ascii(word);
        if (!lower.empty()) {
            lower[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[0])));
        }
        out += lower;
    }
    return out;
}

std::optional<std::string_view> ToSnakeSpecialCase(std::string_view class_name) {
    if (class_name == "JSONRPC") return "json_rpc";
    if (class_name == "OpenXRAPIExtension") return "open_xr_api_extension";
    if (class_name == "OpenXRIPBinding") return "open_xr_ip_binding";
    return std::nullopt;
}

constexpr std::string_view kRustKeywords[] = {
    "abstract", "as",     "async",   "await",  "become",   "box",    "break",  "const",
    "continue", "crate",  "do",      "dyn",    "else",     "enum",   "extern", "false",
    "final",    "fn",     "for",     "gen",    "if",       "impl",   "in",     "let",
    "loop",     "macro",  "match",   "mod",    "move",     "mut",    "override", "priv",
    "pub",      "ref",    "return",  "self",   "Self",     "static", "struct", "super",
    "trait",    "true",   "try",     "type",   "typeof",   "unsafe", "unsized", "use",
    "virtual",  "where",  "while",   "yield",
};

std::optional<std::string_view> PointeeType(std::string_view c_type) {
    if (c_type == "void") return "std::ffi::c_void";
    if (c_type == "bool") return "bool";
    if (c_type == "int8_t") return "i8";
    if (c_type == "uint8_t") return "u8";
    if (c_type == "int16_t") return "i16";
    if (c_type == "uint16_t") return "u16";
    if (c_type == "int32_t") return "i32";
    if (c_type == "uint32_t") return "u32";
    if (c_type == "int64_t") return "i64";
    if (c_type == "uint64_t") return "u64";
    if (c_type == "float") return "f32";
    if (c_type == "double") return "f64";
    if (c_type == "real_t") return "crate::builtin::real";
    return std::nullopt;
}

std::optional<std::string_view> IntegerMeta(std::string_view meta) {
    if (meta == "int8") return "i8";
    if (meta == "int16") return "i16";
    if (meta == "int32") return "i32";
    if (meta == "int64") return "i64";
    if (meta == "uint8") return "u8";
    if (meta == "uint16") return "u16";
    if (meta == "uint32") return "u32";
    if (meta == "uint64") return "u64";
    if (meta == "char16") return "u16";
    if (meta == "char32") return "u32";
    return std::nullopt;
}

RustTy MakeEnumType(std::string_view qualified, bool is_bitfield, const Context& ctx) {
    RustTy ty;
    ty.kind = is_bitfield ? RustTy::Kind::EngineBitfield : RustTy::Kind::EngineEnum;

    auto dot = qualified.rfind('.');
    if (dot == std::string_view::npos) {
        ty.tokens = fmt::format("crate::global::{}", make_enum_name(qualified));
        return ty;
    }

    auto owner = qualified.substr(0, dot);
    auto enum_name = qualified.substr(dot + 1);

    // Enums of Variant and of builtin types live in the builtin module: `Vector3.Axis` -> `Vector3Axis`.
    if (owner == "Variant" || ctx.is_builtin(owner)) {
        ty.tokens = fmt::format("crate::builtin::{}{}", to_pascal_case(owner), make_enum_name(enum_name));
        return ty;
    }

    if (!ctx.is_engine_class(owner)) {
        GDXCODEGEN_WARN("Enum {} refers to unknown class {}", qualified, owner);
    }
    ty.tokens = fmt::format("crate::classes::{}::{}", to_snake_case(owner), make_enum_name(enum_name));
    ty.surrounding_class = std::string(owner);
    return ty;
}

RustTy MakePointerType(std::string_view godot_type, const Context& ctx) {
    std::string_view inner = string::trim(godot_type);
    bool is_const = false;
    if (string::starts_with(inner, "const ")) {
        is_const = true;
        inner = string::trim(inner.substr(6));
    }

    // Strip exactly one level; nested pointers recurse.
    inner = string::trim(inner.substr(0, inner.size() - 1));

    std::string pointee;
    if (string::ends_with(inner, "*")) {
        pointee = MakePointerType(inner, ctx).tokens;
    } else if (auto primitive = PointeeType(inner)) {
        pointee = std::string(*primitive);
    } else if (ctx.is_native_structure(inner)) {
        pointee = fmt::format("crate::classes::native::{}", inner);
    } else {
        pointee = to_rust_type(inner, std::nullopt, ctx).tokens;
    }

    return RustTy{RustTy::Kind::RawPointer,
                  fmt::format("{} {}", is_const ? "*const" : "*mut", pointee), std::nullopt};
}

}  // namespace

std::string to_snake_case(std::string_view name) {
    if (auto special = ToSnakeSpecialCase(name)) {
        return std::string(*special);
    }

    auto prepared = string::replace_all(name, "1D", "_1d");
    prepared = string::replace_all(prepared, "2D", "_2d");
    prepared = string::replace_all(prepared, "3D", "_3d");

    std::vector<std::string> words;
    for (const auto& word : SplitWords(prepared)) {
        words.push_back(string::to_lower_ascii(word));
    }
    return string::join(words, "_");
}

std::string to_pascal_case(std::string_view name) {
    if (auto special = ToSnakeSpecialCase(name)) {
        return PascalFromWords(SplitWords(*special));
    }

    auto pascal = PascalFromWords(SplitWords(name));
    pascal = string::replace_all(pascal, "GdExtension", "GDExtension");
    pascal = string::replace_all(pascal, "GdScript", "GDScript");
    pascal = string::replace_all(pascal, "Vsync", "VSync");
    return pascal;
}

std::string shout_to_pascal(std::string_view name) { return PascalFromWords(SplitWords(name)); }

std::string make_enum_name(std::string_view godot_enum_name) {
    return string::replace_all(godot_enum_name, ".", "");
}

std::vector<std::string> make_enumerator_names(const std::vector<std::string>& godot_names) {
    std::vector<std::string> result;
    result.reserve(godot_names.size());

    if (godot_names.size() < 2) {
        for (const auto& name : godot_names) {
            result.push_back(safe_ident(name));
        }
        return result;
    }

    std::vector<std::vector<std::string_view>> split;
    split.reserve(godot_names.size());
    for (const auto& name : godot_names) {
        split.push_back(string::split(name, '_'));
    }

    // Longest shared word prefix that leaves at least one word in every name.
    size_t prefix_len = split.front().size();
    for (const auto& words : split) {
        prefix_len = std::min(prefix_len, words.size() - 1);
        for (size_t i = 0; i < prefix_len; ++i) {
            if (words[i] != split.front()[i]) {
                prefix_len = i;
                break;
            }
        }
    }

    for (size_t n = 0; n < godot_names.size(); ++n) {
        const auto& words = split[n];
        std::string_view first_remaining = words[prefix_len];
        if (prefix_len == 0 || first_remaining.empty() || IsDigit(first_remaining.front())) {
            result.push_back(safe_ident(godot_names[n]));
            continue;
        }

        std::vector<std::string> rest(words.begin() + static_cast<std::ptrdiff_t>(prefix_len), words.end());
        result.push_back(safe_ident(string::join(rest, "_")));
    }

    std::set<std::string_view> seen;
    bool has_duplicates = false;
    for (const auto& name : result) {
        if (!seen.insert(name).second) {
            GDXCODEGEN_DEBUG("Enumerator prefix stripping creates duplicate '{}'; keeping full names", name);
            has_duplicates = true;
            break;
        }
    }

    if (has_duplicates) {
        result.clear();
        for (const auto& godot_name : godot_names) {
            result.push_back(safe_ident(godot_name));
        }
    }
    return result;
}

bool is_rust_keyword(std::string_view ident) {
    return std::find(std::begin(kRustKeywords), std::end(kRustKeywords), ident) != std::end(kRustKeywords);
}

std::string safe_ident(std::string_view ident) {
    if (is_rust_keyword(ident)) {
        return fmt::format("{}_", ident);
    }
    return std::string(ident);
}

std::string normalize_type_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c != '_') {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

RustTy to_rust_type(std::string_view godot_type, std::optional<std::string_view> meta, const Context& ctx) {
    using Kind = RustTy::Kind;

    if (godot_type.empty()) {
        return RustTy{Kind::BuiltinIdent, "()", std::nullopt};
    }

    if (string::ends_with(godot_type, "*")) {
        return MakePointerType(godot_type, ctx);
    }

    if (string::starts_with(godot_type, "enum::")) {
        return MakeEnumType(godot_type.substr(6), false, ctx);
    }
    if (string::starts_with(godot_type, "bitfield::")) {
        return MakeEnumType(godot_type.substr(10), true, ctx);
    }

    if (string::starts_with(godot_type, "typedarray::")) {
        auto inner = to_rust_type(godot_type.substr(12), std::nullopt, ctx);
        return RustTy{Kind::BuiltinArray, fmt::format("Array<{}>", inner.tokens), std::nullopt};
    }

    if (godot_type == "int") {
        if (meta) {
            if (auto ident = IntegerMeta(*meta)) {
                return RustTy{Kind::BuiltinIdent, std::string(*ident), std::nullopt};
            }
        }
        return RustTy{Kind::BuiltinIdent, "i64", std::nullopt};
    }
    if (godot_type == "float") {
        std::string ident = (meta && *meta == "float") ? "f32" : "f64";
        return RustTy{Kind::BuiltinIdent, ident, std::nullopt};
    }
    if (godot_type == "bool") return RustTy{Kind::BuiltinIdent, "bool", std::nullopt};
    if (godot_type == "String") return RustTy{Kind::BuiltinIdent, "GString", std::nullopt};
    if (godot_type == "Array") return RustTy{Kind::BuiltinIdent, "VariantArray", std::nullopt};
    if (godot_type == "Variant") return RustTy{Kind::BuiltinIdent, "Variant", std::nullopt};
    if (godot_type == "Nil") return RustTy{Kind::BuiltinIdent, "()", std::nullopt};

    if (godot_type == "Object" || ctx.is_engine_class(godot_type)) {
        return RustTy{Kind::EngineClass, fmt::format("Gd<crate::classes::{}>", godot_type), std::nullopt};
    }

    if (ctx.is_builtin(godot_type)) {
        return RustTy{Kind::BuiltinIdent, to_pascal_case(godot_type), std::nullopt};
    }

    GDXCODEGEN_WARN("Unknown Godot type '{}', mapping by name", godot_type);
    return RustTy{Kind::BuiltinIdent, to_pascal_case(godot_type), std::nullopt};
}

}  // namespace gdx::codegen::conv
