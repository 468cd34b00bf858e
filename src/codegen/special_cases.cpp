/**
 * @file        codegen/special_cases.cpp
 * @brief       Hand-maintained exceptions to the generic mapping rules
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/special_cases.h>
#include <gdx/codegen/json_models.h>

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>

namespace gdx::codegen::special_cases {

namespace {

template <size_t N>
bool Contains(const std::string_view (&table)[N], std::string_view name) {
    return std::find(std::begin(table), std::end(table), name) != std::end(table);
}

constexpr std::string_view kDeletedClasses[] = {
    // Engine internals that leak into the API description
    "FramebufferCacheRD",
    "GDScriptEditorTranslationParserPlugin",
    "GDScriptNativeClass",
    "GLTFDocumentExtensionPhysics",
    "GLTFDocumentExtensionTextureWebP",
    "GodotPhysicsServer2D",
    "GodotPhysicsServer3D",
    "IPUnix",
    "MovieWriterMJPEG",
    "MovieWriterPNGWAV",
    "ResourceFormatImporterSaver",
    "UniformSetCacheRD",

    // Platform specific
    "JavaClass",
    "JavaClassWrapper",
    "JavaObject",
    "JavaScriptBridge",
    "JavaScriptObject",
    "JNISingleton",
};

// Provided by the Rust object model
constexpr std::pair<std::string_view, std::string_view> kDeletedMethods[] = {
    {"Object", "to_string"},
    {"Object", "get_instance_id"},
};

constexpr std::string_view kDeletedUtilityFunctions[] = {
    "is_instance_valid",
    "instance_from_id",
};

constexpr std::string_view kExhaustiveGlobalEnums[] = {
    "ClockDirection",
    "Corner",
    "EulerOrder",
    "Side",
    "Orientation",
};

constexpr std::string_view kPrivateGlobalEnums[] = {
    "Corner",
    "EulerOrder",
    "Side",
    "Variant.Operator",
    "Variant.Type",
};

constexpr std::string_view kServerClasses[] = {
    "AudioServer",
    "CameraServer",
    "DisplayServer",
    "NavigationServer2D",
    "NavigationServer3D",
    "RenderingServer",
    "TranslationServer",
    "XRServer",

    "PhysicsDirectBodyState2D",
    "PhysicsDirectBodyState2DExtension",
    "PhysicsDirectSpaceState2D",
    "PhysicsDirectSpaceState2DExtension",
    "PhysicsServer2D",
    "PhysicsServer2DExtension",
    "PhysicsServer2DManager",
    "PhysicsShapeQueryParameters2D",
    "PhysicsTestMotionParameters2D",
    "PhysicsTestMotionResult2D",

    "PhysicsDirectBodyState3D",
    "PhysicsDirectBodyState3DExtension",
    "PhysicsDirectSpaceState3D",
    "PhysicsDirectSpaceState3DExtension",
    "PhysicsServer3D",
    "PhysicsServer3DExtension",
    "PhysicsServer3DManager",
    "PhysicsServer3DRenderingServerHandler",
    "PhysicsShapeQueryParameters3D",
    "PhysicsTestMotionParameters3D",
};

constexpr std::string_view kCoreClasses[] = {
    "Object",
    "OpenXRExtensionWrapperExtension",
};

constexpr std::string_view kExperimentalClasses[] = {
    "GraphEdit",
    "GraphElement",
    "GraphFrame",
    "GraphNode",
    "NavigationAgent2D",
    "NavigationAgent3D",
    "NavigationLink2D",
    "NavigationLink3D",
    "NavigationMesh",
    "NavigationMeshGenerator",
    "NavigationMeshSourceGeometryData2D",
    "NavigationMeshSourceGeometryData3D",
    "NavigationObstacle2D",
    "NavigationObstacle3D",
    "NavigationPathQueryParameters2D",
    "NavigationPathQueryParameters3D",
    "NavigationPathQueryResult2D",
    "NavigationPathQueryResult3D",
    "NavigationPolygon",
    "NavigationRegion2D",
    "NavigationRegion3D",
    "NavigationServer2D",
    "NavigationServer3D",
    "SkeletonModification2D",
};

constexpr std::string_view kMisclassifiedEditorClasses[] = {
    "ResourceImporterOggVorbis",
    "ResourceImporterMP3",
};

}  // namespace

bool is_class_deleted(std::string_view class_name) {
    return Contains(kDeletedClasses, class_name);
}

bool is_class_method_deleted(std::string_view class_name, std::string_view method_name) {
    return std::find(std::begin(kDeletedMethods), std::end(kDeletedMethods),
                     std::pair{class_name, method_name}) != std::end(kDeletedMethods);
}

bool is_utility_function_deleted(std::string_view function_name) {
    return Contains(kDeletedUtilityFunctions, function_name);
}

std::optional<std::string_view> maybe_rename_class_method(std::string_view /*class_name*/,
                                                          std::string_view method_name) {
    // `new` is reserved for the Rust-side constructor of every class.
    if (method_name == "new") {
        return "instantiate";
    }
    return std::nullopt;
}

bool is_enum_exhaustive(std::optional<std::string_view> class_name, std::string_view enum_name) {
    return !class_name && Contains(kExhaustiveGlobalEnums, enum_name);
}

bool is_enum_private(std::optional<std::string_view> class_name, std::string_view enum_name) {
    return !class_name && Contains(kPrivateGlobalEnums, enum_name);
}

std::optional<RustTy> as_enum_bitmaskable(const Enum& enum_) {
    if (enum_.surrounding_class || enum_.is_bitfield) {
        return std::nullopt;
    }
    if (enum_.godot_name == "Key") {
        return RustTy{RustTy::Kind::EngineBitfield, "crate::global::KeyModifierMask", std::nullopt};
    }
    return std::nullopt;
}

bool is_class_level_server(std::string_view class_name) {
    return Contains(kServerClasses, class_name);
}

bool is_class_level_core(std::string_view class_name) {
    return Contains(kCoreClasses, class_name);
}

bool is_class_experimental(std::string_view class_name) {
    return Contains(kExperimentalClasses, class_name);
}

bool is_class_editor_override(std::string_view class_name, ApiVersion active) {
    return active < ApiVersion{4, 3} && Contains(kMisclassifiedEditorClasses, class_name);
}

Result<ClassCodegenLevel> get_api_level(const JsonClass& class_, ApiVersion active) {
    if (is_class_level_core(class_.name)) {
        return ClassCodegenLevel::Core;
    }
    if (is_class_level_server(class_.name)) {
        return ClassCodegenLevel::Servers;
    }
    if (class_.api_type == "editor" || is_class_editor_override(class_.name, active)) {
        return ClassCodegenLevel::Editor;
    }
    if (class_.api_type == "core") {
        return ClassCodegenLevel::Scene;
    }
    return Err<ClassCodegenLevel>(
        ErrorCategory::Validation,
        fmt::format("class {} has unknown API type '{}'", class_.name, class_.api_type));
}

}  // namespace gdx::codegen::special_cases
