/**
 * @file        codegen/codegen.cpp
 * @brief       Codegen pipeline implementation
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/codegen.h>
#include <gdx/codegen/central_files.h>
#include <gdx/codegen/class_enums.h>
#include <gdx/codegen/code_writer.h>
#include <gdx/codegen/context.h>
#include <gdx/codegen/emitter.h>
#include <gdx/codegen/json_models.h>
#include <gdx/codegen/loader.h>
#include <gdx/logging.h>
#include <gdx/string.h>

#include <utility>

#include <fmt/format.h>

namespace gdx::codegen {

namespace {

Result<void> FlushEmitter(Emitter& emitter, std::string_view what) {
    auto result = emitter.flush();
    if (!result) {
        return Err(result.error());
    }
    GDXCODEGEN_INFO("{}: {} files written, {} unchanged", what, result->written, result->unchanged);
    return Ok();
}

std::string MakeSysMod() {
    CodeWriter w;
    w.println("pub mod central;");
    return WithGeneratedHeader(w.take());
}

std::string MakeCoreMod(bool has_classes) {
    CodeWriter w;
    w.println("pub mod central;");
    if (has_classes) {
        w.println("pub mod classes;");
    }
    return WithGeneratedHeader(w.take());
}

}  // namespace

std::optional<CodegenTarget> ParseCodegenTarget(std::string_view name) {
    if (name == "sys") return CodegenTarget::Sys;
    if (name == "core") return CodegenTarget::Core;
    if (name == "all") return CodegenTarget::All;
    return std::nullopt;
}

std::string_view CodegenTargetName(CodegenTarget target) {
    switch (target) {
        case CodegenTarget::Sys: return "sys";
        case CodegenTarget::Core: return "core";
        case CodegenTarget::All: return "all";
    }
    return "unknown";
}

std::string WithGeneratedHeader(std::string_view body) {
    std::string out(kGeneratedHeader);
    out += "\n";
    out += body;
    return out;
}

std::string MakeRustcCfgFile(ApiVersion active) {
    std::string out;
    for (const auto& flag : MakeApiCfgFlags(active)) {
        out += flag;
        out += '\n';
    }
    return out;
}

Result<void> GenerateSysFiles(const ExtensionApi& api, Emitter& emitter, time::StopWatch& watch) {
    GDXCODEGEN_INFO("Generating sys files");
    emitter.submit(std::string(paths::kSysCentral), WithGeneratedHeader(make_sys_central_code(api)));
    emitter.submit(std::string(paths::kSysMod), MakeSysMod());
    watch.record("generate_sys_files");

    auto result = FlushEmitter(emitter, "sys");
    watch.record("write_sys_files");
    return result;
}

Result<void> GenerateCoreFiles(const ExtensionApi& api, const Context& ctx, Emitter& emitter,
                               time::StopWatch& watch) {
    GDXCODEGEN_INFO("Generating core files");
    emitter.submit(std::string(paths::kCoreCentral), WithGeneratedHeader(make_core_central_code(api, ctx)));
    watch.record("generate_core_central");

    std::filesystem::path classes_dir(paths::kClassesDir);
    size_t class_modules = 0;
    for (const auto& class_ : api.classes) {
        if (!has_class_module(class_)) {
            continue;
        }
        emitter.submit(classes_dir / fmt::format("{}.rs", class_.mod_name()),
                       WithGeneratedHeader(make_class_module(class_)));
        ++class_modules;
    }
    if (class_modules > 0) {
        emitter.submit(classes_dir / "mod.rs", WithGeneratedHeader(make_classes_mod(api.classes)));
    }
    emitter.submit(std::string(paths::kCoreMod), MakeCoreMod(class_modules > 0));
    GDXCODEGEN_DEBUG("{} class modules", class_modules);
    watch.record("generate_class_modules");

    auto result = FlushEmitter(emitter, "core");
    watch.record("write_core_files");
    return result;
}

CodegenPipeline::CodegenPipeline() : watch_(time::StopWatch::Start()) {}
CodegenPipeline::~CodegenPipeline() = default;
CodegenPipeline::CodegenPipeline(CodegenPipeline&&) noexcept = default;
CodegenPipeline& CodegenPipeline::operator=(CodegenPipeline&&) noexcept = default;

Result<CodegenPipeline> CodegenPipeline::Create(const CodegenOptions& options) {
    GDXCODEGEN_INFO("Loading {}", options.api_json.string());
    auto watch = time::StopWatch::Start();

    auto document = LoadExtensionApi(options.api_json);
    if (!document) {
        return Err<CodegenPipeline>(document.error());
    }
    watch.record("load_json");

    return Build(std::move(*document), options, std::move(watch));
}

Result<CodegenPipeline> CodegenPipeline::FromDocument(JsonExtensionApi document, const CodegenOptions& options) {
    return Build(std::move(document), options, time::StopWatch::Start());
}

Result<CodegenPipeline> CodegenPipeline::Build(JsonExtensionApi document, const CodegenOptions& options,
                                               time::StopWatch watch) {
    CodegenPipeline pipeline;
    pipeline.options_ = options;
    pipeline.watch_ = std::move(watch);

    ApiVersion active{document.header.version_major, document.header.version_minor};
    FilterByApiVersion(document, active);

    auto ctx = Context::Build(document);
    if (!ctx) {
        return Err<CodegenPipeline>(ctx.error());
    }
    pipeline.ctx_ = std::make_unique<Context>(std::move(*ctx));
    pipeline.watch_.record("build_context");

    auto api = MapDomainModels(document, *pipeline.ctx_, options.precision);
    if (!api) {
        return Err<CodegenPipeline>(api.error());
    }
    pipeline.api_ = std::make_unique<ExtensionApi>(std::move(*api));
    pipeline.watch_.record("map_domain_models");

    return Ok(std::move(pipeline));
}

Result<void> CodegenPipeline::Run() {
    GDXCODEGEN_INFO("Pipeline: target '{}', precision {}, output {}", CodegenTargetName(options_.target),
                    PrecisionName(options_.precision), options_.output_dir.string());
    GDX_LOG_FLUSH();

    Emitter emitter(options_.output_dir);

    if (options_.target == CodegenTarget::Sys || options_.target == CodegenTarget::All) {
        auto result = GenerateSysFiles(*api_, emitter, watch_);
        if (!result) {
            GDXLOG_ERROR("Generating sys files failed: {}", result.error().message);
            return result;
        }
    }

    if (options_.target == CodegenTarget::Core || options_.target == CodegenTarget::All) {
        auto result = GenerateCoreFiles(*api_, *ctx_, emitter, watch_);
        if (!result) {
            GDXLOG_ERROR("Generating core files failed: {}", result.error().message);
            return result;
        }
    }

    emitter.submit(std::string(paths::kRustcCfg), MakeRustcCfgFile(ctx_->api_version()));
    auto cfg_result = FlushEmitter(emitter, "cfg");
    if (!cfg_result) {
        return cfg_result;
    }

    if (options_.write_stats) {
        auto stats_path = options_.output_dir / paths::kStats;
        auto stats_result = watch_.write_stats_to(stats_path);
        if (!stats_result) {
            return stats_result;
        }
        GDXCODEGEN_DEBUG("{}", watch_.format_stats());
    }

    GDXCODEGEN_INFO("Code generation complete.");
    return Ok();
}

}  // namespace gdx::codegen
