/**
 * @file        gdx/codegen/models.h
 * @brief       Domain model of the engine extension API
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gdx/codegen/api_version.h>

namespace gdx::codegen {

//=============================================================================
// Build configuration
//=============================================================================

enum class Precision {
    Single,
    Double,
};

/// One column of `builtin_class_sizes`: float precision x pointer width.
enum class BuildConfig {
    Float32,
    Float64,
    Double32,
    Double64,
};

std::optional<BuildConfig> ParseBuildConfig(std::string_view name);
std::string_view BuildConfigName(BuildConfig config);
bool Is64Bit(BuildConfig config);
Precision PrecisionOf(BuildConfig config);
BuildConfig MakeBuildConfig(Precision precision, bool is_64bit);

std::optional<Precision> ParsePrecision(std::string_view name);
std::string_view PrecisionName(Precision precision);

//=============================================================================
// Types
//=============================================================================

/// A Rust type as referenced from generated code.
struct RustTy {
    enum class Kind {
        BuiltinIdent,    // i64, GString, Vector2 ...
        BuiltinArray,    // Array<T>
        RawPointer,      // *const T / *mut T
        EngineEnum,
        EngineBitfield,
        EngineClass,     // Gd<T>
    };

    Kind kind = Kind::BuiltinIdent;
    std::string tokens;
    std::optional<std::string> surrounding_class;  // Engine enums declared inside a class

    bool operator==(const RustTy&) const = default;
};

//=============================================================================
// Enums
//=============================================================================

class EnumeratorValue {
public:
    static EnumeratorValue Enum(int32_t ord) { return EnumeratorValue(false, ord); }
    static EnumeratorValue Bitfield(uint64_t bits) { return EnumeratorValue(true, static_cast<int64_t>(bits)); }

    bool is_bitfield() const { return is_bitfield_; }

    /// Only valid for enum values.
    int32_t ord() const { return static_cast<int32_t>(value_); }

    /// Only valid for bitfield values.
    uint64_t bits() const { return static_cast<uint64_t>(value_); }

    /// Sort key; bitfield values above INT64_MAX wrap.
    int64_t to_i64() const { return value_; }

    /// Rust literal for the value (`-1`, `4`, `9223372036854775808`).
    std::string to_literal() const;

    bool operator==(const EnumeratorValue&) const = default;

private:
    EnumeratorValue(bool is_bitfield, int64_t value) : is_bitfield_(is_bitfield), value_(value) {}

    bool is_bitfield_;
    int64_t value_;
};

struct Enumerator {
    std::string name;        // Rust identifier, common prefix stripped
    std::string godot_name;  // As spelled in the API description
    EnumeratorValue value = EnumeratorValue::Enum(0);
};

struct Enum {
    std::string name;        // Rust identifier
    std::string godot_name;  // "Variant.Type", "ProcessMode" ...
    std::optional<std::string> surrounding_class;
    bool is_bitfield = false;
    bool is_exhaustive = false;
    bool is_private = false;
    std::vector<Enumerator> enumerators;

    /// `i32` for enums, `u64` for bitfields.
    std::string_view ord_type() const;

    /// `crate::obj::EngineEnum` or `crate::obj::EngineBitfield`.
    std::string_view engine_trait() const;

    std::vector<std::string_view> derives() const;

    /// Distinct ordinals in ascending order. Empty for bitfields.
    std::vector<int32_t> unique_ords() const;

    /**
     * Enumerator count of an index enum.
     *
     * An index enum covers the ordinals 0..N-1 without gaps (aliases may
     * repeat one) followed by a `MAX` sentinel whose value is N.
     *
     * @return N, or nullopt for bitfields and non-index enums
     */
    std::optional<size_t> find_index_enum_max() const;

    const Enumerator* find_enumerator(std::string_view rust_name) const;
};

struct Constant {
    std::string name;
    int64_t value = 0;
};

//=============================================================================
// Classes, builtins, functions
//=============================================================================

enum class ClassCodegenLevel {
    Core,
    Servers,
    Scene,
    Editor,
};

std::string_view ClassCodegenLevelName(ClassCodegenLevel level);

struct FnParam {
    std::string name;
    RustTy type;
    std::optional<std::string> default_value;
};

struct ClassMethod {
    std::string name;        // Rust name after renames
    std::string godot_name;
    bool is_const = false;
    bool is_static = false;
    bool is_virtual = false;
    bool is_vararg = false;
    std::optional<uint32_t> hash;
    std::optional<RustTy> return_type;
    std::vector<FnParam> params;
};

struct Class {
    std::string name;
    std::optional<std::string> base_class;
    ClassCodegenLevel level = ClassCodegenLevel::Scene;
    bool is_refcounted = false;
    bool is_instantiable = false;
    bool is_experimental = false;
    bool is_singleton = false;
    std::vector<Enum> enums;
    std::vector<Constant> constants;
    std::vector<ClassMethod> methods;

    /// snake_case module name (`Node2D` -> `node_2d`).
    std::string mod_name() const;
};

struct BuiltinSize {
    std::string builtin_original_name;
    BuildConfig config = BuildConfig::Float64;
    size_t size = 0;
};

/// One variant type other than NIL: a builtin class or `Object`.
struct BuiltinVariant {
    std::string godot_original_name;  // "int", "Vector2i", "Object"
    std::string godot_shout_name;     // VariantType enumerator: "INT", "VECTOR2I"
    bool is_keyed = false;
    std::optional<std::string> indexing_return_type;
};

struct NativeStructure {
    std::string name;
    std::string format;
};

struct UtilityFunction {
    std::string name;
    std::string category;
    bool is_vararg = false;
    std::optional<uint32_t> hash;
    std::optional<RustTy> return_type;
    std::vector<FnParam> params;
};

struct GodotApiVersion {
    uint8_t major = 4;
    uint8_t minor = 0;
    uint8_t patch = 0;
    std::string status;     // "stable", "rc1" ...
    std::string full_name;  // "Godot Engine v4.3.stable.official"

    ApiVersion api() const { return ApiVersion{major, minor}; }
};

/// Root of the domain model; read-only once built.
struct ExtensionApi {
    GodotApiVersion godot_version;
    Precision precision = Precision::Single;
    std::vector<BuiltinVariant> builtins;
    std::vector<BuiltinSize> builtin_sizes;
    std::vector<Enum> global_enums;
    std::vector<Constant> global_constants;
    std::vector<Class> classes;
    std::vector<NativeStructure> native_structures;
    std::vector<UtilityFunction> utility_functions;

    const Enum* find_global_enum(std::string_view rust_name) const;
    const Class* find_class(std::string_view name) const;
};

}  // namespace gdx::codegen
