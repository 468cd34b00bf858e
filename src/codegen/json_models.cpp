/**
 * @file        codegen/json_models.cpp
 * @brief       Raw records of extension_api.json
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/json_models.h>
#include <gdx/logging.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace gdx::codegen {

using nlohmann::json;

namespace {

template <typename T>
T Required(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw std::runtime_error(fmt::format("missing field '{}'", key));
    }
    return it->get<T>();
}

// Integer field narrowed to T; values outside T's range are errors, not wrapped.
template <typename T>
T CheckedInteger(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(fmt::format("field '{}' must be an integer", key));
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::runtime_error(fmt::format("field '{}' value {} is out of range", key, u));
        }
        return static_cast<T>(u);
    }

    auto i = value.get<int64_t>();
    bool in_range = i < 0 ? (std::numeric_limits<T>::is_signed &&
                             i >= static_cast<int64_t>(std::numeric_limits<T>::min()))
                          : static_cast<uint64_t>(i) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    if (!in_range) {
        throw std::runtime_error(fmt::format("field '{}' value {} is out of range", key, i));
    }
    return static_cast<T>(i);
}

template <typename T>
T RequiredInteger(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw std::runtime_error(fmt::format("missing field '{}'", key));
    }
    return CheckedInteger<T>(*it, key);
}

template <typename T>
void Optional(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
void Optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

std::optional<ApiVersion> ParseGateVersion(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    auto text = it->get<std::string>();
    auto version = ApiVersion::Parse(text);
    if (!version) {
        throw std::runtime_error(fmt::format("invalid {} '{}'", key, text));
    }
    return version;
}

VersionGate ParseGate(const json& j) {
    VersionGate gate;
    gate.since = ParseGateVersion(j, "since_api");
    gate.before = ParseGateVersion(j, "before_api");
    return gate;
}

template <typename T>
std::vector<T> ParseSection(const json& root, const char* section, bool required,
                            std::string_view source_name) {
    auto it = root.find(section);
    if (it == root.end()) {
        if (required) {
            throw std::runtime_error(
                fmt::format("{}: missing required section '{}'", source_name, section));
        }
        return {};
    }
    if (!it->is_array()) {
        throw std::runtime_error(
            fmt::format("{}: section '{}' must be an array", source_name, section));
    }

    try {
        return it->get<std::vector<T>>();
    } catch (const std::exception& e) {
        throw std::runtime_error(
            fmt::format("{}: section '{}': {}", source_name, section, e.what()));
    }
}

}  // namespace

//=============================================================================
// Record conversion
//=============================================================================

void from_json(const json& j, JsonHeader& out) {
    out.version_major = RequiredInteger<uint8_t>(j, "version_major");
    out.version_minor = RequiredInteger<uint8_t>(j, "version_minor");
    if (auto it = j.find("version_patch"); it != j.end() && !it->is_null()) {
        out.version_patch = CheckedInteger<uint8_t>(*it, "version_patch");
    }
    Optional(j, "version_status", out.version_status);
    Optional(j, "version_build", out.version_build);
    Optional(j, "version_full_name", out.version_full_name);
}

void from_json(const json& j, JsonBuiltinSize& out) {
    out.name = Required<std::string>(j, "name");
    out.size = RequiredInteger<size_t>(j, "size");
}

void from_json(const json& j, JsonBuiltinSizes& out) {
    out.build_configuration = Required<std::string>(j, "build_configuration");
    out.sizes = Required<std::vector<JsonBuiltinSize>>(j, "sizes");
}

void from_json(const json& j, JsonEnumConstant& out) {
    out.name = Required<std::string>(j, "name");
    out.value = RequiredInteger<int64_t>(j, "value");
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonEnum& out) {
    out.name = Required<std::string>(j, "name");
    Optional(j, "is_bitfield", out.is_bitfield);
    out.values = Required<std::vector<JsonEnumConstant>>(j, "values");
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonConstant& out) {
    out.name = Required<std::string>(j, "name");
    out.value = RequiredInteger<int64_t>(j, "value");
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonMethodArg& out) {
    out.name = Required<std::string>(j, "name");
    out.type = Required<std::string>(j, "type");
    Optional(j, "meta", out.meta);
    Optional(j, "default_value", out.default_value);
}

void from_json(const json& j, JsonMethodReturn& out) {
    out.type = Required<std::string>(j, "type");
    Optional(j, "meta", out.meta);
}

void from_json(const json& j, JsonClassMethod& out) {
    out.name = Required<std::string>(j, "name");
    Optional(j, "is_const", out.is_const);
    Optional(j, "is_vararg", out.is_vararg);
    Optional(j, "is_static", out.is_static);
    Optional(j, "is_virtual", out.is_virtual);
    Optional(j, "hash", out.hash);
    Optional(j, "return_value", out.return_value);
    Optional(j, "arguments", out.arguments);
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonClass& out) {
    out.name = Required<std::string>(j, "name");
    Optional(j, "is_refcounted", out.is_refcounted);
    Optional(j, "is_instantiable", out.is_instantiable);
    Optional(j, "inherits", out.inherits);
    out.api_type = Required<std::string>(j, "api_type");
    Optional(j, "enums", out.enums);
    Optional(j, "constants", out.constants);
    Optional(j, "methods", out.methods);
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonBuiltinClass& out) {
    out.name = Required<std::string>(j, "name");
    Optional(j, "indexing_return_type", out.indexing_return_type);
    Optional(j, "is_keyed", out.is_keyed);
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonSingleton& out) {
    out.name = Required<std::string>(j, "name");
    out.type = Required<std::string>(j, "type");
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonNativeStructure& out) {
    out.name = Required<std::string>(j, "name");
    out.format = Required<std::string>(j, "format");
    out.gate = ParseGate(j);
}

void from_json(const json& j, JsonUtilityFunction& out) {
    out.name = Required<std::string>(j, "name");
    Optional(j, "return_type", out.return_type);
    out.category = Required<std::string>(j, "category");
    Optional(j, "is_vararg", out.is_vararg);
    Optional(j, "hash", out.hash);
    Optional(j, "arguments", out.arguments);
    out.gate = ParseGate(j);
}

//=============================================================================
// Document loading
//=============================================================================

Result<JsonExtensionApi> ParseExtensionApi(std::string_view text, std::string_view source_name) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return Err<JsonExtensionApi>(ErrorCategory::Parse,
                                     fmt::format("{}: invalid JSON: {}", source_name, e.what()));
    }

    if (!root.is_object()) {
        return Err<JsonExtensionApi>(ErrorCategory::Parse,
                                     fmt::format("{}: top level must be an object", source_name));
    }

    JsonExtensionApi api;
    try {
        auto header = root.find("header");
        if (header == root.end()) {
            throw std::runtime_error(fmt::format("{}: missing required section 'header'", source_name));
        }
        if (!header->is_object()) {
            throw std::runtime_error(fmt::format("{}: section 'header' must be an object", source_name));
        }
        try {
            api.header = header->get<JsonHeader>();
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format("{}: section 'header': {}", source_name, e.what()));
        }

        api.builtin_class_sizes = ParseSection<JsonBuiltinSizes>(root, "builtin_class_sizes", true, source_name);
        api.builtin_classes = ParseSection<JsonBuiltinClass>(root, "builtin_classes", true, source_name);
        api.classes = ParseSection<JsonClass>(root, "classes", true, source_name);
        api.global_enums = ParseSection<JsonEnum>(root, "global_enums", true, source_name);
        api.global_constants = ParseSection<JsonConstant>(root, "global_constants", false, source_name);
        api.singletons = ParseSection<JsonSingleton>(root, "singletons", false, source_name);
        api.native_structures = ParseSection<JsonNativeStructure>(root, "native_structures", false, source_name);
        api.utility_functions = ParseSection<JsonUtilityFunction>(root, "utility_functions", false, source_name);
    } catch (const std::exception& e) {
        return Err<JsonExtensionApi>(ErrorCategory::Parse, e.what());
    }

    GDXCODEGEN_DEBUG("Parsed {}: {} classes, {} builtin classes, {} global enums", source_name,
                     api.classes.size(), api.builtin_classes.size(), api.global_enums.size());
    return api;
}

Result<JsonExtensionApi> LoadExtensionApi(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<JsonExtensionApi>(ErrorCategory::IO,
                                     fmt::format("Failed to open API description {}", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<JsonExtensionApi>(ErrorCategory::IO,
                                     fmt::format("Failed to read API description {}", path.string()));
    }

    return ParseExtensionApi(buffer.str(), path.string());
}

void FilterByApiVersion(JsonExtensionApi& api, ApiVersion active) {
    auto excluded = [active](const auto& record) { return !record.gate.Admits(active); };

    size_t removed = 0;
    removed += std::erase_if(api.builtin_classes, excluded);
    removed += std::erase_if(api.classes, excluded);
    removed += std::erase_if(api.global_enums, excluded);
    removed += std::erase_if(api.global_constants, excluded);
    removed += std::erase_if(api.singletons, excluded);
    removed += std::erase_if(api.native_structures, excluded);
    removed += std::erase_if(api.utility_functions, excluded);

    for (auto& e : api.global_enums) {
        removed += std::erase_if(e.values, excluded);
    }
    for (auto& c : api.classes) {
        removed += std::erase_if(c.enums, excluded);
        removed += std::erase_if(c.constants, excluded);
        removed += std::erase_if(c.methods, excluded);
        for (auto& e : c.enums) {
            removed += std::erase_if(e.values, excluded);
        }
    }

    GDXCODEGEN_DEBUG("API {}: {} version-gated records removed", active.ToString(), removed);
}

}  // namespace gdx::codegen
