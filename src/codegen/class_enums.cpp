/**
 * @file        codegen/class_enums.cpp
 * @brief       Per-class modules holding class enums and constants
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/class_enums.h>
#include <gdx/codegen/code_writer.h>
#include <gdx/codegen/conv.h>
#include <gdx/codegen/enums.h>

#include <algorithm>
#include <map>

#include <fmt/format.h>

namespace gdx::codegen {

bool has_class_module(const Class& class_) {
    return !class_.enums.empty() || !class_.constants.empty();
}

std::string make_class_cfg_attributes(const Class& class_) {
    if (class_.is_experimental) {
        return fmt::format("{}\n", kExperimentalFeatureCfg);
    }
    return {};
}

std::string make_class_module(const Class& class_) {
    auto cfg = make_class_cfg_attributes(class_);

    CodeWriter w;
    w.println("//! Enums and constants of `{}`.", class_.name);
    w.println();

    for (const auto& constant : class_.constants) {
        w.append(cfg);
        w.println("pub const {}: i64 = {};", conv::safe_ident(constant.name), constant.value);
    }
    if (!class_.constants.empty()) {
        w.println();
    }

    w.append(make_enums(class_.enums, cfg));
    return w.take();
}

std::string make_classes_mod(const std::vector<Class>& classes) {
    std::map<ClassCodegenLevel, std::vector<const Class*>> by_level;
    for (const auto& class_ : classes) {
        if (has_class_module(class_)) {
            by_level[class_.level].push_back(&class_);
        }
    }

    CodeWriter w;
    bool first = true;
    for (auto& [level, members] : by_level) {
        std::sort(members.begin(), members.end(),
                  [](const Class* a, const Class* b) { return a->name < b->name; });

        if (!first) {
            w.println();
        }
        first = false;

        w.println("// Level: {}", ClassCodegenLevelName(level));
        for (const auto* class_ : members) {
            w.append(make_class_cfg_attributes(*class_));
            w.println("pub mod {};", class_->mod_name());
        }
    }
    return w.take();
}

}  // namespace gdx::codegen
