/**
 * @file        gdx/codegen/api_version.h
 * @brief       Godot API versions and version-gated records
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdx::codegen {

/// API level as `major.minor`; patch releases never change the API surface.
struct ApiVersion {
    uint8_t major = 4;
    uint8_t minor = 0;

    /// Accepts "4.2" (and "4.2.1", ignoring the patch component).
    static std::optional<ApiVersion> Parse(std::string_view text);

    std::string ToString() const;

    auto operator<=>(const ApiVersion&) const = default;
};

inline constexpr ApiVersion kMinSupportedApi{4, 0};
inline constexpr ApiVersion kMaxSupportedApi{4, 4};

bool IsSupportedApi(ApiVersion version);

/// Availability window of a record: `since <= active < before`.
struct VersionGate {
    std::optional<ApiVersion> since;
    std::optional<ApiVersion> before;

    bool Admits(ApiVersion active) const;
    bool empty() const { return !since && !before; }
};

/**
 * Build the cfg flags downstream crates compile against: `since_api` for
 * every supported version up to `active`, `before_api` for the later ones.
 *
 * @return Lines of the form `cargo:rustc-cfg=since_api="4.1"`
 */
std::vector<std::string> MakeApiCfgFlags(ApiVersion active);

}  // namespace gdx::codegen
