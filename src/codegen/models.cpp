/**
 * @file        codegen/models.cpp
 * @brief       Domain model of the engine extension API
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/models.h>
#include <gdx/codegen/conv.h>
#include <gdx/string.h>

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace gdx::codegen {

//=============================================================================
// Build configuration
//=============================================================================

std::optional<BuildConfig> ParseBuildConfig(std::string_view name) {
    if (name == "float_32") return BuildConfig::Float32;
    if (name == "float_64") return BuildConfig::Float64;
    if (name == "double_32") return BuildConfig::Double32;
    if (name == "double_64") return BuildConfig::Double64;
    return std::nullopt;
}

std::string_view BuildConfigName(BuildConfig config) {
    switch (config) {
        case BuildConfig::Float32: return "float_32";
        case BuildConfig::Float64: return "float_64";
        case BuildConfig::Double32: return "double_32";
        case BuildConfig::Double64: return "double_64";
    }
    return "unknown";
}

bool Is64Bit(BuildConfig config) {
    return config == BuildConfig::Float64 || config == BuildConfig::Double64;
}

Precision PrecisionOf(BuildConfig config) {
    return (config == BuildConfig::Double32 || config == BuildConfig::Double64) ? Precision::Double
                                                                                : Precision::Single;
}

BuildConfig MakeBuildConfig(Precision precision, bool is_64bit) {
    if (precision == Precision::Double) {
        return is_64bit ? BuildConfig::Double64 : BuildConfig::Double32;
    }
    return is_64bit ? BuildConfig::Float64 : BuildConfig::Float32;
}

std::optional<Precision> ParsePrecision(std::string_view name) {
    auto lower = string::to_lower_ascii(name);
    if (lower == "single") return Precision::Single;
    if (lower == "double") return Precision::Double;
    return std::nullopt;
}

std::string_view PrecisionName(Precision precision) {
    return precision == Precision::Double ? "double" : "single";
}

//=============================================================================
// Enums
//=============================================================================

std::string EnumeratorValue::to_literal() const {
    if (is_bitfield_) {
        return fmt::format("{}", bits());
    }
    return fmt::format("{}", ord());
}

std::string_view Enum::ord_type() const { return is_bitfield ? "u64" : "i32"; }

std::string_view Enum::engine_trait() const {
    return is_bitfield ? "crate::obj::EngineBitfield" : "crate::obj::EngineEnum";
}

std::vector<std::string_view> Enum::derives() const {
    std::vector<std::string_view> result = {"Copy", "Clone", "Eq", "PartialEq", "Hash"};
    if (is_bitfield) {
        result.push_back("Default");
    }
    return result;
}

std::vector<int32_t> Enum::unique_ords() const {
    std::vector<int32_t> ords;
    if (is_bitfield) {
        return ords;
    }
    ords.reserve(enumerators.size());
    for (const auto& enumerator : enumerators) {
        ords.push_back(enumerator.value.ord());
    }
    std::sort(ords.begin(), ords.end());
    ords.erase(std::unique(ords.begin(), ords.end()), ords.end());
    return ords;
}

std::optional<size_t> Enum::find_index_enum_max() const {
    if (is_bitfield || enumerators.size() < 2) {
        return std::nullopt;
    }

    std::vector<std::pair<std::string_view, int64_t>> sorted;
    sorted.reserve(enumerators.size());
    for (const auto& enumerator : enumerators) {
        sorted.emplace_back(enumerator.name, enumerator.value.to_i64());
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    const auto [last_name, last_value] = sorted.back();
    if (last_name != "MAX" && !string::ends_with(last_name, "_MAX")) {
        return std::nullopt;
    }

    // Aliases may repeat an ordinal; the range below the sentinel has no gaps.
    if (sorted.front().second != 0) {
        return std::nullopt;
    }
    int64_t previous = 0;
    for (size_t i = 1; i + 1 < sorted.size(); ++i) {
        int64_t value = sorted[i].second;
        if (value != previous && value != previous + 1) {
            return std::nullopt;
        }
        previous = value;
    }

    if (last_value != previous + 1) {
        return std::nullopt;
    }
    return static_cast<size_t>(last_value);
}

const Enumerator* Enum::find_enumerator(std::string_view rust_name) const {
    auto it = std::find_if(enumerators.begin(), enumerators.end(),
                           [&](const Enumerator& e) { return e.name == rust_name; });
    return it != enumerators.end() ? &*it : nullptr;
}

//=============================================================================
// Classes
//=============================================================================

std::string_view ClassCodegenLevelName(ClassCodegenLevel level) {
    switch (level) {
        case ClassCodegenLevel::Core: return "core";
        case ClassCodegenLevel::Servers: return "servers";
        case ClassCodegenLevel::Scene: return "scene";
        case ClassCodegenLevel::Editor: return "editor";
    }
    return "unknown";
}

std::string Class::mod_name() const { return conv::to_snake_case(name); }

const Enum* ExtensionApi::find_global_enum(std::string_view rust_name) const {
    for (const auto& e : global_enums) {
        if (e.name == rust_name) {
            return &e;
        }
    }
    return nullptr;
}

const Class* ExtensionApi::find_class(std::string_view class_name) const {
    for (const auto& c : classes) {
        if (c.name == class_name) {
            return &c;
        }
    }
    return nullptr;
}

}  // namespace gdx::codegen
