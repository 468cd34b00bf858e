/**
 * @file        gdx/codegen/json_models.h
 * @brief       Raw records of extension_api.json
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <gdx/codegen/api_version.h>
#include <gdx/result.h>

namespace gdx::codegen {

// Records mirror the JSON layout one to one. Every record that can be
// version-gated carries its `since_api` / `before_api` window in `gate`.

struct JsonHeader {
    uint8_t version_major = 4;
    uint8_t version_minor = 0;
    uint8_t version_patch = 0;
    std::string version_status;
    std::string version_build;
    std::string version_full_name;
};

struct JsonBuiltinSize {
    std::string name;
    size_t size = 0;
};

struct JsonBuiltinSizes {
    std::string build_configuration;
    std::vector<JsonBuiltinSize> sizes;
};

struct JsonEnumConstant {
    std::string name;
    int64_t value = 0;
    VersionGate gate;
};

struct JsonEnum {
    std::string name;
    bool is_bitfield = false;
    std::vector<JsonEnumConstant> values;
    VersionGate gate;
};

struct JsonConstant {
    std::string name;
    int64_t value = 0;
    VersionGate gate;
};

struct JsonMethodArg {
    std::string name;
    std::string type;
    std::optional<std::string> meta;
    std::optional<std::string> default_value;
};

struct JsonMethodReturn {
    std::string type;
    std::optional<std::string> meta;
};

struct JsonClassMethod {
    std::string name;
    bool is_const = false;
    bool is_vararg = false;
    bool is_static = false;
    bool is_virtual = false;
    std::optional<uint32_t> hash;
    std::optional<JsonMethodReturn> return_value;
    std::vector<JsonMethodArg> arguments;
    VersionGate gate;
};

struct JsonClass {
    std::string name;
    bool is_refcounted = false;
    bool is_instantiable = false;
    std::optional<std::string> inherits;
    std::string api_type;
    std::vector<JsonEnum> enums;
    std::vector<JsonConstant> constants;
    std::vector<JsonClassMethod> methods;
    VersionGate gate;
};

struct JsonBuiltinClass {
    std::string name;
    std::optional<std::string> indexing_return_type;
    bool is_keyed = false;
    VersionGate gate;
};

struct JsonSingleton {
    std::string name;
    std::string type;
    VersionGate gate;
};

struct JsonNativeStructure {
    std::string name;
    std::string format;
    VersionGate gate;
};

struct JsonUtilityFunction {
    std::string name;
    std::optional<std::string> return_type;
    std::string category;
    bool is_vararg = false;
    std::optional<uint32_t> hash;
    std::vector<JsonMethodArg> arguments;
    VersionGate gate;
};

struct JsonExtensionApi {
    JsonHeader header;
    std::vector<JsonBuiltinSizes> builtin_class_sizes;
    std::vector<JsonBuiltinClass> builtin_classes;
    std::vector<JsonClass> classes;
    std::vector<JsonEnum> global_enums;
    std::vector<JsonConstant> global_constants;
    std::vector<JsonSingleton> singletons;
    std::vector<JsonNativeStructure> native_structures;
    std::vector<JsonUtilityFunction> utility_functions;
};

void from_json(const nlohmann::json& j, JsonHeader& out);
void from_json(const nlohmann::json& j, JsonBuiltinSize& out);
void from_json(const nlohmann::json& j, JsonBuiltinSizes& out);
void from_json(const nlohmann::json& j, JsonEnumConstant& out);
void from_json(const nlohmann::json& j, JsonEnum& out);
void from_json(const nlohmann::json& j, JsonConstant& out);
void from_json(const nlohmann::json& j, JsonMethodArg& out);
void from_json(const nlohmann::json& j, JsonMethodReturn& out);
void from_json(const nlohmann::json& j, JsonClassMethod& out);
void from_json(const nlohmann::json& j, JsonClass& out);
void from_json(const nlohmann::json& j, JsonBuiltinClass& out);
void from_json(const nlohmann::json& j, JsonSingleton& out);
void from_json(const nlohmann::json& j, JsonNativeStructure& out);
void from_json(const nlohmann::json& j, JsonUtilityFunction& out);

/**
 * Parse an API description from memory.
 *
 * @param text JSON document
 * @param source_name Used in error messages (usually the file path)
 * @return Raw records, or a Parse error naming the offending section
 */
Result<JsonExtensionApi> ParseExtensionApi(std::string_view text, std::string_view source_name);

/// Read and parse `path`. Fails with an IO error when the file is unreadable.
Result<JsonExtensionApi> LoadExtensionApi(const std::filesystem::path& path);

/// Drop every record whose version window excludes `active`.
void FilterByApiVersion(JsonExtensionApi& api, ApiVersion active);

}  // namespace gdx::codegen
