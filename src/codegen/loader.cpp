/**
 * @file        codegen/loader.cpp
 * @brief       Raw API records to domain model
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/loader.h>
#include <gdx/codegen/context.h>
#include <gdx/codegen/conv.h>
#include <gdx/codegen/json_models.h>
#include <gdx/codegen/special_cases.h>
#include <gdx/logging.h>

#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace gdx::codegen {

namespace {

constexpr std::string_view kVariantTypeEnum = "Variant.Type";

std::string Describe(const JsonEnum& json, std::optional<std::string_view> surrounding_class) {
    if (surrounding_class) {
        return fmt::format("{}.{}", *surrounding_class, json.name);
    }
    return json.name;
}

Result<std::vector<BuiltinVariant>> MapBuiltins(const JsonExtensionApi& json) {
    const JsonEnum* variant_type = nullptr;
    for (const auto& e : json.global_enums) {
        if (e.name == kVariantTypeEnum) {
            variant_type = &e;
            break;
        }
    }
    if (!variant_type) {
        return Err<std::vector<BuiltinVariant>>(ErrorCategory::Validation,
                                                "missing global enum 'Variant.Type'");
    }

    std::map<std::string, const JsonBuiltinClass*> by_normalized_name;
    for (const auto& builtin : json.builtin_classes) {
        by_normalized_name.emplace(conv::normalize_type_name(builtin.name), &builtin);
    }

    std::vector<std::string> godot_names;
    for (const auto& value : variant_type->values) {
        godot_names.push_back(value.name);
    }
    auto shout_names = conv::make_enumerator_names(godot_names);

    std::vector<BuiltinVariant> builtins;
    for (const auto& shout : shout_names) {
        if (shout == "NIL" || shout == "MAX") {
            continue;
        }

        BuiltinVariant builtin;
        builtin.godot_shout_name = shout;
        if (shout == "OBJECT") {
            builtin.godot_original_name = "Object";
        } else {
            auto it = by_normalized_name.find(conv::normalize_type_name(shout));
            if (it == by_normalized_name.end()) {
                return Err<std::vector<BuiltinVariant>>(
                    ErrorCategory::Validation,
                    fmt::format("VariantType enumerator {} has no matching builtin class", shout));
            }
            builtin.godot_original_name = it->second->name;
            builtin.is_keyed = it->second->is_keyed;
            builtin.indexing_return_type = it->second->indexing_return_type;
        }
        builtins.push_back(std::move(builtin));
    }
    return builtins;
}

std::vector<BuiltinSize> MapBuiltinSizes(const JsonExtensionApi& json, Precision precision) {
    std::vector<BuiltinSize> sizes;
    for (const auto& config_sizes : json.builtin_class_sizes) {
        auto config = ParseBuildConfig(config_sizes.build_configuration);
        if (!config) {
            GDXCODEGEN_WARN("Ignoring unknown build configuration '{}'", config_sizes.build_configuration);
            continue;
        }
        if (PrecisionOf(*config) != precision) {
            continue;
        }
        for (const auto& entry : config_sizes.sizes) {
            sizes.push_back(BuiltinSize{entry.name, *config, entry.size});
        }
    }
    return sizes;
}

std::vector<FnParam> MapParams(const std::vector<JsonMethodArg>& args, const Context& ctx) {
    std::vector<FnParam> params;
    params.reserve(args.size());
    for (const auto& arg : args) {
        std::optional<std::string_view> meta;
        if (arg.meta) {
            meta = *arg.meta;
        }
        params.push_back(FnParam{conv::safe_ident(arg.name), conv::to_rust_type(arg.type, meta, ctx),
                                 arg.default_value});
    }
    return params;
}

ClassMethod MapMethod(const std::string& class_name, const JsonClassMethod& json, const Context& ctx) {
    ClassMethod method;
    method.godot_name = json.name;
    if (auto renamed = special_cases::maybe_rename_class_method(class_name, json.name)) {
        method.name = std::string(*renamed);
    } else {
        method.name = conv::safe_ident(json.name);
    }
    method.is_const = json.is_const;
    method.is_static = json.is_static;
    method.is_virtual = json.is_virtual;
    method.is_vararg = json.is_vararg;
    method.hash = json.hash;
    if (json.return_value) {
        std::optional<std::string_view> meta;
        if (json.return_value->meta) {
            meta = *json.return_value->meta;
        }
        method.return_type = conv::to_rust_type(json.return_value->type, meta, ctx);
    }
    method.params = MapParams(json.arguments, ctx);
    return method;
}

Result<std::vector<Enum>> MapEnums(const std::vector<JsonEnum>& json_enums,
                                   std::optional<std::string_view> surrounding_class) {
    std::vector<Enum> enums;
    std::set<std::string> names;
    for (const auto& json_enum : json_enums) {
        auto mapped = MapEnum(json_enum, surrounding_class);
        if (!mapped) {
            return Err<std::vector<Enum>>(mapped.error());
        }
        if (!names.insert(mapped->name).second) {
            return Err<std::vector<Enum>>(
                ErrorCategory::Validation,
                fmt::format("duplicate enum '{}'", Describe(json_enum, surrounding_class)));
        }
        enums.push_back(std::move(*mapped));
    }
    return enums;
}

Result<Class> MapClass(const JsonClass& json, const Context& ctx) {
    Class class_;
    class_.name = json.name;
    class_.base_class = json.inherits;
    class_.is_refcounted = json.is_refcounted;
    class_.is_instantiable = json.is_instantiable;
    class_.is_experimental = special_cases::is_class_experimental(json.name);
    class_.is_singleton = ctx.is_singleton(json.name);

    auto level = ctx.class_level(json.name);
    if (!level) {
        return Err<Class>(ErrorCategory::Internal,
                          fmt::format("class {} is missing from the context", json.name));
    }
    class_.level = *level;

    auto enums = MapEnums(json.enums, json.name);
    if (!enums) {
        return Err<Class>(enums.error());
    }
    class_.enums = std::move(*enums);

    for (const auto& constant : json.constants) {
        class_.constants.push_back(Constant{constant.name, constant.value});
    }

    for (const auto& method : json.methods) {
        if (special_cases::is_class_method_deleted(json.name, method.name)) {
            GDXCODEGEN_TRACE("Skipping deleted method {}::{}", json.name, method.name);
            continue;
        }
        class_.methods.push_back(MapMethod(json.name, method, ctx));
    }

    return class_;
}

}  // namespace

Result<Enum> MapEnum(const JsonEnum& json, std::optional<std::string_view> surrounding_class) {
    const auto description = Describe(json, surrounding_class);

    Enum enum_;
    enum_.godot_name = json.name;
    enum_.name = conv::make_enum_name(json.name);
    if (surrounding_class) {
        enum_.surrounding_class = std::string(*surrounding_class);
    }
    enum_.is_bitfield = json.is_bitfield;
    enum_.is_exhaustive = special_cases::is_enum_exhaustive(surrounding_class, json.name);
    enum_.is_private = special_cases::is_enum_private(surrounding_class, json.name);

    if (enum_.is_bitfield && enum_.is_exhaustive) {
        return Err<Enum>(ErrorCategory::Validation,
                         fmt::format("bitfield {} cannot be exhaustive", description));
    }

    std::vector<std::string> godot_names;
    std::set<std::string_view> seen_names;
    for (const auto& value : json.values) {
        if (!seen_names.insert(value.name).second) {
            return Err<Enum>(ErrorCategory::Validation,
                             fmt::format("duplicate enumerator {} in {}", value.name, description));
        }
        godot_names.push_back(value.name);
    }
    auto rust_names = conv::make_enumerator_names(godot_names);

    std::set<int64_t> seen_ords;
    for (size_t i = 0; i < json.values.size(); ++i) {
        const auto& value = json.values[i];

        EnumeratorValue mapped = EnumeratorValue::Enum(0);
        if (enum_.is_bitfield) {
            if (value.value < 0) {
                return Err<Enum>(ErrorCategory::Validation,
                                 fmt::format("negative bitfield value {} for {}.{}", value.value,
                                             description, value.name));
            }
            mapped = EnumeratorValue::Bitfield(static_cast<uint64_t>(value.value));
        } else {
            if (value.value < std::numeric_limits<int32_t>::min() ||
                value.value > std::numeric_limits<int32_t>::max()) {
                return Err<Enum>(ErrorCategory::Validation,
                                 fmt::format("value {} of {}.{} does not fit in i32", value.value,
                                             description, value.name));
            }
            if (!seen_ords.insert(value.value).second && enum_.is_exhaustive) {
                return Err<Enum>(ErrorCategory::Validation,
                                 fmt::format("exhaustive enum {} has duplicate ordinal {}", description,
                                             value.value));
            }
            mapped = EnumeratorValue::Enum(static_cast<int32_t>(value.value));
        }

        enum_.enumerators.push_back(Enumerator{rust_names[i], value.name, mapped});
    }

    return enum_;
}

Result<ExtensionApi> MapDomainModels(const JsonExtensionApi& json, const Context& ctx, Precision precision) {
    ExtensionApi api;
    api.precision = precision;
    api.godot_version.major = json.header.version_major;
    api.godot_version.minor = json.header.version_minor;
    api.godot_version.patch = json.header.version_patch;
    api.godot_version.status = json.header.version_status;
    api.godot_version.full_name = json.header.version_full_name;

    auto builtins = MapBuiltins(json);
    if (!builtins) {
        return Err<ExtensionApi>(builtins.error());
    }
    api.builtins = std::move(*builtins);
    api.builtin_sizes = MapBuiltinSizes(json, precision);

    auto global_enums = MapEnums(json.global_enums, std::nullopt);
    if (!global_enums) {
        return Err<ExtensionApi>(global_enums.error());
    }
    api.global_enums = std::move(*global_enums);

    for (const auto& constant : json.global_constants) {
        api.global_constants.push_back(Constant{constant.name, constant.value});
    }

    for (const auto& json_class : json.classes) {
        if (special_cases::is_class_deleted(json_class.name)) {
            GDXCODEGEN_DEBUG("Skipping deleted class {}", json_class.name);
            continue;
        }
        auto class_ = MapClass(json_class, ctx);
        if (!class_) {
            return Err<ExtensionApi>(class_.error());
        }
        api.classes.push_back(std::move(*class_));
    }

    for (const auto& native : json.native_structures) {
        api.native_structures.push_back(NativeStructure{native.name, native.format});
    }

    for (const auto& function : json.utility_functions) {
        if (special_cases::is_utility_function_deleted(function.name)) {
            continue;
        }

        UtilityFunction mapped;
        mapped.name = function.name;
        mapped.category = function.category;
        mapped.is_vararg = function.is_vararg;
        mapped.hash = function.hash;
        if (function.return_type) {
            mapped.return_type = conv::to_rust_type(*function.return_type, std::nullopt, ctx);
        }
        mapped.params = MapParams(function.arguments, ctx);
        api.utility_functions.push_back(std::move(mapped));
    }

    GDXCODEGEN_INFO("Domain model: Godot {}.{}.{}, {} builtins, {} global enums, {} classes",
                    api.godot_version.major, api.godot_version.minor, api.godot_version.patch,
                    api.builtins.size(), api.global_enums.size(), api.classes.size());
    return api;
}

}  // namespace gdx::codegen
