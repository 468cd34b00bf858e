/**
 * @file        gdx/codegen/class_enums.h
 * @brief       Per-class modules holding class enums and constants
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <gdx/codegen/models.h>

namespace gdx::codegen {

/// Cargo feature gating classes the engine marks experimental.
inline constexpr std::string_view kExperimentalFeatureCfg = "#[cfg(feature = \"experimental-godot-api\")]";

/// Whether `class_` gets its own module (it declares enums or constants).
bool has_class_module(const Class& class_);

/// Attribute lines placed before every item of the class module.
std::string make_class_cfg_attributes(const Class& class_);

/// Body of `classes/<snake>.rs`: integer constants, then the class enums.
std::string make_class_module(const Class& class_);

/// Body of `classes/mod.rs`: one `pub mod` per class module, grouped by codegen level.
std::string make_classes_mod(const std::vector<Class>& classes);

}  // namespace gdx::codegen
