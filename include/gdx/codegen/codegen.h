/**
 * @file        gdx/codegen/codegen.h
 * @brief       Codegen pipeline orchestration
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <gdx/codegen/models.h>
#include <gdx/result.h>
#include <gdx/time/stopwatch.h>

namespace gdx::codegen {

class Context;
class Emitter;
struct JsonExtensionApi;

enum class CodegenTarget {
    Sys,   // FFI-level central file
    Core,  // Trait impls, dispatch, global and class enums
    All,
};

std::optional<CodegenTarget> ParseCodegenTarget(std::string_view name);
std::string_view CodegenTargetName(CodegenTarget target);

struct CodegenOptions {
    std::filesystem::path api_json;
    std::filesystem::path output_dir;
    Precision precision = Precision::Single;
    CodegenTarget target = CodegenTarget::All;
    bool write_stats = true;
};

/// Output file names, relative to the output directory.
namespace paths {
inline constexpr std::string_view kSysCentral = "sys/central.rs";
inline constexpr std::string_view kSysMod = "sys/mod.rs";
inline constexpr std::string_view kCoreCentral = "core/central.rs";
inline constexpr std::string_view kCoreMod = "core/mod.rs";
inline constexpr std::string_view kClassesDir = "core/classes";
inline constexpr std::string_view kRustcCfg = "rustc-cfg.txt";
inline constexpr std::string_view kStats = "codegen-stats.txt";
}  // namespace paths

/**
 * Owns one generation run: loading, the read-only models and output.
 *
 * Create() loads and validates the API description; Run() generates and
 * writes the selected target. Nothing is written when Create() fails.
 */
class CodegenPipeline {
public:
    ~CodegenPipeline();
    CodegenPipeline(CodegenPipeline&&) noexcept;
    CodegenPipeline& operator=(CodegenPipeline&&) noexcept;

    /// Load `options.api_json` and build the models.
    static Result<CodegenPipeline> Create(const CodegenOptions& options);

    /// Build the models from an already parsed document.
    static Result<CodegenPipeline> FromDocument(JsonExtensionApi document, const CodegenOptions& options);

    Result<void> Run();

    const ExtensionApi& api() const { return *api_; }
    const Context& context() const { return *ctx_; }
    const time::StopWatch& stopwatch() const { return watch_; }

private:
    CodegenPipeline();

    static Result<CodegenPipeline> Build(JsonExtensionApi document, const CodegenOptions& options,
                                         time::StopWatch watch);

    CodegenOptions options_;
    std::unique_ptr<Context> ctx_;
    std::unique_ptr<ExtensionApi> api_;
    time::StopWatch watch_;
};

/// Prefix a generated Rust body with the do-not-edit header.
std::string WithGeneratedHeader(std::string_view body);

Result<void> GenerateSysFiles(const ExtensionApi& api, Emitter& emitter, time::StopWatch& watch);
Result<void> GenerateCoreFiles(const ExtensionApi& api, const Context& ctx, Emitter& emitter,
                               time::StopWatch& watch);

/// `rustc-cfg.txt` content for the active API version.
std::string MakeRustcCfgFile(ApiVersion active);

}  // namespace gdx::codegen
