/**
 * @file        codegen/context.cpp
 * @brief       Lookup tables shared by every generator
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/context.h>
#include <gdx/codegen/json_models.h>
#include <gdx/codegen/special_cases.h>
#include <gdx/logging.h>


#include <fmt/format.h>

namespace gdx::codegen {

Result<Context> Context::Build(const JsonExtensionApi& api) {
    Context ctx;
    ctx.api_version_ = ApiVersion{api.header.version_major, api.header.version_minor};
    if (!IsSupportedApi(ctx.api_version_)) {
        GDXCODEGEN_WARN("API version {} is outside the supported range {}..{}",
                        ctx.api_version_.ToString(), kMinSupportedApi.ToString(),
                        kMaxSupportedApi.ToString());
    }

    for (const auto& builtin : api.builtin_classes) {
        ctx.builtins_.insert(builtin.name);
    }

    for (const auto& class_ : api.classes) {
        if (special_cases::is_class_deleted(class_.name)) {
            continue;
        }

        auto level = special_cases::get_api_level(class_, ctx.api_version_);
        if (!level) {
            return Err<Context>(level.error());
        }
        if (!ctx.classes_.emplace(class_.name, *level).second) {
            return Err<Context>(ErrorCategory::Validation,
                                fmt::format("duplicate class '{}'", class_.name));
        }
    }

    for (const auto& singleton : api.singletons) {
        if (!special_cases::is_class_deleted(singleton.name)) {
            ctx.singletons_.insert(singleton.name);
        }
    }

    for (const auto& native : api.native_structures) {
        ctx.native_structures_.insert(native.name);
    }

    GDXCODEGEN_DEBUG("Context: {} builtins, {} classes, {} singletons", ctx.builtins_.size(),
                     ctx.classes_.size(), ctx.singletons_.size());
    return ctx;
}

bool Context::is_builtin(std::string_view name) const { return builtins_.contains(name); }

bool Context::is_engine_class(std::string_view name) const { return classes_.contains(name); }

bool Context::is_singleton(std::string_view name) const { return singletons_.contains(name); }

bool Context::is_native_structure(std::string_view name) const {
    return native_structures_.contains(name);
}

std::optional<ClassCodegenLevel> Context::class_level(std::string_view class_name) const {
    auto it = classes_.find(class_name);
    if (it == classes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace gdx::codegen
