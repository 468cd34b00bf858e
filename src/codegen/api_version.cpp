/**
 * @file        codegen/api_version.cpp
 * @brief       Godot API versions and version-gated records
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/api_version.h>
#include <gdx/string.h>

#include <charconv>

#include <fmt/format.h>

namespace gdx::codegen {

namespace {

bool ParseComponent(std::string_view text, uint8_t& out) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty() || value > 255) {
        return false;
    }
    out = static_cast<uint8_t>(value);
    return true;
}

}  // namespace

std::optional<ApiVersion> ApiVersion::Parse(std::string_view text) {
    auto parts = string::split(string::trim(text), '.');
    if (parts.size() < 2 || parts.size() > 3) {
        return std::nullopt;
    }

    ApiVersion version;
    uint8_t patch = 0;
    if (!ParseComponent(parts[0], version.major) || !ParseComponent(parts[1], version.minor)) {
        return std::nullopt;
    }
    if (parts.size() == 3 && !ParseComponent(parts[2], patch)) {
        return std::nullopt;
    }
    return version;
}

std::string ApiVersion::ToString() const { return fmt::format("{}.{}", major, minor); }

bool IsSupportedApi(ApiVersion version) {
    return version >= kMinSupportedApi && version <= kMaxSupportedApi;
}

bool VersionGate::Admits(ApiVersion active) const {
    if (since && active < *since) {
        return false;
    }
    if (before && active >= *before) {
        return false;
    }
    return true;
}

std::vector<std::string> MakeApiCfgFlags(ApiVersion active) {
    std::vector<std::string> flags;
    for (uint8_t minor = kMinSupportedApi.minor; minor <= kMaxSupportedApi.minor; ++minor) {
        ApiVersion version{kMinSupportedApi.major, minor};
        const char* key = (version <= active) ? "since_api" : "before_api";
        flags.push_back(fmt::format("cargo:rustc-cfg={}=\"{}\"", key, version.ToString()));
    }
    return flags;
}

}  // namespace gdx::codegen
