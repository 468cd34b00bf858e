/**
 * @file        core/cvar.cpp
 * @brief       Configuration variable registry and argument parsing
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/cvar.h>
#include <gdx/string.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <map>
#include <optional>

#include <fmt/format.h>

namespace gdx::cvar {

namespace {

struct Registry {
    std::vector<FlagBase*> flags;
    std::multimap<std::string, ChangeCallback, std::less<>> callbacks;
    std::vector<std::string> unknown_flags;
    std::vector<std::string> parse_errors;
};

// Function-local so flags defined in other translation units can register
// during static initialization.
Registry& GetRegistry() {
    static Registry registry;
    return registry;
}

std::string NormalizeFlagName(std::string_view name) {
    std::string normalized(name);
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return normalized;
}

void NotifyChanged(const FlagBase& flag) {
    auto& registry = GetRegistry();
    auto [begin, end] = registry.callbacks.equal_range(flag.name());
    std::string value = flag.ToString();
    for (auto it = begin; it != end; ++it) {
        it->second(value);
    }
}

}  // namespace

FlagBase::FlagBase(std::string_view name, std::string_view category, std::string_view description)
    : name_(name), category_(category), description_(description) {
    GetRegistry().flags.push_back(this);
}

bool ParseValue(std::string_view text, bool& out) {
    std::string lowered = string::to_lower_ascii(text);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ParseValue(std::string_view text, int32_t& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last && !text.empty();
}

bool ParseValue(std::string_view text, std::string& out) {
    out.assign(text);
    return true;
}

std::string FormatValue(bool value) { return value ? "true" : "false"; }
std::string FormatValue(int32_t value) { return std::to_string(value); }
std::string FormatValue(const std::string& value) { return value; }

FlagBase* FindFlag(std::string_view name) {
    std::string normalized = NormalizeFlagName(name);
    for (auto* flag : GetRegistry().flags) {
        if (flag->name() == normalized) {
            return flag;
        }
    }
    return nullptr;
}

bool SetFlagByName(std::string_view name, std::string_view value) {
    FlagBase* flag = FindFlag(name);
    if (!flag || !flag->Parse(value)) {
        return false;
    }
    NotifyChanged(*flag);
    return true;
}

void OnChange(std::string_view name, ChangeCallback callback) {
    GetRegistry().callbacks.emplace(NormalizeFlagName(name), std::move(callback));
}

std::vector<std::string> Init(int argc, char** argv) {
    auto& registry = GetRegistry();
    std::vector<std::string> positional;
    bool only_positional = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (only_positional || !string::starts_with(arg, "--") || arg.size() == 2) {
            if (arg == "--" && !only_positional) {
                only_positional = true;
                continue;
            }
            positional.emplace_back(arg);
            continue;
        }

        std::string_view body = arg.substr(2);
        std::string_view name = body;
        std::optional<std::string_view> value;
        if (auto eq = body.find('='); eq != std::string_view::npos) {
            name = body.substr(0, eq);
            value = body.substr(eq + 1);
        }

        FlagBase* flag = FindFlag(name);
        if (!flag) {
            registry.unknown_flags.emplace_back(name);
            continue;
        }

        if (!value) {
            if (flag->is_bool()) {
                value = "true";
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                registry.parse_errors.push_back(fmt::format("--{} requires a value", flag->name()));
                continue;
            }
        }

        if (!flag->Parse(*value)) {
            registry.parse_errors.push_back(
                fmt::format("Invalid value '{}' for --{}", *value, flag->name()));
            continue;
        }
        NotifyChanged(*flag);
    }

    return positional;
}

void ApplyEnvironment() {
    for (auto* flag : GetRegistry().flags) {
        if (flag->is_set()) {
            continue;
        }
        std::string env_name = "GDX_" + string::to_upper_ascii(flag->name());
        const char* env_value = std::getenv(env_name.c_str());
        if (!env_value) {
            continue;
        }
        if (flag->Parse(env_value)) {
            NotifyChanged(*flag);
        } else {
            GetRegistry().parse_errors.push_back(
                fmt::format("Invalid value '{}' in environment variable {}", env_value, env_name));
        }
    }
}

const std::vector<std::string>& UnknownFlags() { return GetRegistry().unknown_flags; }

const std::vector<std::string>& ParseErrors() { return GetRegistry().parse_errors; }

std::vector<FlagBase*> ListFlags() {
    std::vector<FlagBase*> flags = GetRegistry().flags;
    std::sort(flags.begin(), flags.end(), [](const FlagBase* a, const FlagBase* b) {
        if (a->category() != b->category()) {
            return a->category() < b->category();
        }
        return a->name() < b->name();
    });
    return flags;
}

std::string Usage() {
    std::string out;
    std::string current_category;
    for (const auto* flag : ListFlags()) {
        if (flag->category() != current_category) {
            current_category = flag->category();
            out += fmt::format("\n{}:\n", current_category);
        }
        std::string default_value = flag->DefaultString();
        out += fmt::format("  --{:<28} {} (default: \"{}\")\n", flag->name(), flag->description(),
                           default_value);
    }
    return out;
}

void ResetAll() {
    auto& registry = GetRegistry();
    for (auto* flag : registry.flags) {
        flag->Reset();
    }
    registry.unknown_flags.clear();
    registry.parse_errors.clear();
}

}  // namespace gdx::cvar
