/**
 * @file        tests/unit/codegen/api_version_test.cpp
 * @brief       Unit tests for API versions, version gates and cfg flags
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <gdx/codegen/api_version.h>

using gdx::codegen::ApiVersion;
using gdx::codegen::VersionGate;

TEST_CASE("ApiVersion::Parse accepts major.minor with an optional patch", "[api_version]") {
  auto v = ApiVersion::Parse("4.2");
  REQUIRE(v);
  CHECK(v->major == 4);
  CHECK(v->minor == 2);

  auto with_patch = ApiVersion::Parse("4.1.3");
  REQUIRE(with_patch);
  CHECK(*with_patch == ApiVersion{4, 1});

  CHECK(ApiVersion::Parse(" 4.3 ") == ApiVersion{4, 3});
}

TEST_CASE("ApiVersion::Parse rejects malformed versions", "[api_version]") {
  CHECK_FALSE(ApiVersion::Parse(""));
  CHECK_FALSE(ApiVersion::Parse("4"));
  CHECK_FALSE(ApiVersion::Parse("4."));
  CHECK_FALSE(ApiVersion::Parse("four.two"));
  CHECK_FALSE(ApiVersion::Parse("4.2.1.0"));
  CHECK_FALSE(ApiVersion::Parse("4.-1"));
  CHECK_FALSE(ApiVersion::Parse("4.300"));
}

TEST_CASE("ApiVersion orders by major then minor", "[api_version]") {
  CHECK(ApiVersion{4, 1} < ApiVersion{4, 2});
  CHECK(ApiVersion{3, 9} < ApiVersion{4, 0});
  CHECK(ApiVersion{4, 10} > ApiVersion{4, 9});
  CHECK(ApiVersion{4, 3}.ToString() == "4.3");
}

TEST_CASE("IsSupportedApi covers 4.0 through 4.4", "[api_version]") {
  CHECK(gdx::codegen::IsSupportedApi(ApiVersion{4, 0}));
  CHECK(gdx::codegen::IsSupportedApi(ApiVersion{4, 4}));
  CHECK_FALSE(gdx::codegen::IsSupportedApi(ApiVersion{3, 5}));
  CHECK_FALSE(gdx::codegen::IsSupportedApi(ApiVersion{4, 5}));
}

TEST_CASE("VersionGate admits since <= active < before", "[api_version]") {
  VersionGate open;
  CHECK(open.empty());
  CHECK(open.Admits(ApiVersion{4, 0}));

  VersionGate since{ApiVersion{4, 2}, std::nullopt};
  CHECK_FALSE(since.Admits(ApiVersion{4, 1}));
  CHECK(since.Admits(ApiVersion{4, 2}));
  CHECK(since.Admits(ApiVersion{4, 4}));

  VersionGate before{std::nullopt, ApiVersion{4, 3}};
  CHECK(before.Admits(ApiVersion{4, 2}));
  CHECK_FALSE(before.Admits(ApiVersion{4, 3}));

  VersionGate window{ApiVersion{4, 1}, ApiVersion{4, 3}};
  CHECK_FALSE(window.empty());
  CHECK_FALSE(window.Admits(ApiVersion{4, 0}));
  CHECK(window.Admits(ApiVersion{4, 2}));
  CHECK_FALSE(window.Admits(ApiVersion{4, 3}));
}

TEST_CASE("MakeApiCfgFlags splits supported versions around the active one", "[api_version]") {
  auto flags = gdx::codegen::MakeApiCfgFlags(ApiVersion{4, 2});
  CHECK(flags == std::vector<std::string>{
                     "cargo:rustc-cfg=since_api=\"4.0\"",
                     "cargo:rustc-cfg=since_api=\"4.1\"",
                     "cargo:rustc-cfg=since_api=\"4.2\"",
                     "cargo:rustc-cfg=before_api=\"4.3\"",
                     "cargo:rustc-cfg=before_api=\"4.4\"",
                 });
}
