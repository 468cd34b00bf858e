/**
 * @file        gdx/codegen/context.h
 * @brief       Lookup tables shared by every generator
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <gdx/codegen/api_version.h>
#include <gdx/codegen/models.h>
#include <gdx/result.h>

namespace gdx::codegen {

struct JsonExtensionApi;

/**
 * Type and class tables derived from the raw API records.
 *
 * Built once per run, after version filtering, and never mutated
 * afterwards. Deleted classes are absent.
 */
class Context {
public:
    static Result<Context> Build(const JsonExtensionApi& api);

    ApiVersion api_version() const { return api_version_; }

    bool is_builtin(std::string_view name) const;
    bool is_engine_class(std::string_view name) const;
    bool is_singleton(std::string_view name) const;
    bool is_native_structure(std::string_view name) const;

    std::optional<ClassCodegenLevel> class_level(std::string_view class_name) const;

    const std::set<std::string, std::less<>>& builtin_names() const { return builtins_; }
    const std::map<std::string, ClassCodegenLevel, std::less<>>& classes() const { return classes_; }

private:
    Context() = default;

    ApiVersion api_version_;
    std::set<std::string, std::less<>> builtins_;
    std::map<std::string, ClassCodegenLevel, std::less<>> classes_;
    std::set<std::string, std::less<>> singletons_;
    std::set<std::string, std::less<>> native_structures_;
};

}  // namespace gdx::codegen
