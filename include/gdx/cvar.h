/**
 * @file        gdx/cvar.h
 * @brief       Command-line / environment configuration variables
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace gdx::cvar {

/// Base of all registered flags. Instances register themselves on
/// construction and must have static storage duration.
class FlagBase {
public:
    FlagBase(std::string_view name, std::string_view category, std::string_view description);
    virtual ~FlagBase() = default;

    FlagBase(const FlagBase&) = delete;
    FlagBase& operator=(const FlagBase&) = delete;

    const std::string& name() const { return name_; }
    const std::string& category() const { return category_; }
    const std::string& description() const { return description_; }

    /// True once the flag was assigned from the command line, the
    /// environment or SetFlagByName.
    bool is_set() const { return set_; }

    virtual bool is_bool() const { return false; }

    /// Parse and assign. Returns false (leaving the value untouched) on
    /// malformed input.
    virtual bool Parse(std::string_view text) = 0;
    virtual std::string ToString() const = 0;
    virtual std::string DefaultString() const = 0;
    virtual void Reset() = 0;

protected:
    void MarkSet(bool set) { set_ = set; }

private:
    std::string name_;
    std::string category_;
    std::string description_;
    bool set_ = false;
};

bool ParseValue(std::string_view text, bool& out);
bool ParseValue(std::string_view text, int32_t& out);
bool ParseValue(std::string_view text, std::string& out);
std::string FormatValue(bool value);
std::string FormatValue(int32_t value);
std::string FormatValue(const std::string& value);

template <typename T>
class Flag final : public FlagBase {
public:
    Flag(std::string_view name, T default_value, std::string_view category,
         std::string_view description)
        : FlagBase(name, category, description),
          value_(default_value),
          default_(std::move(default_value)) {}

    const T& value() const { return value_; }

    bool is_bool() const override { return std::is_same_v<T, bool>; }

    bool Parse(std::string_view text) override {
        T parsed{};
        if (!ParseValue(text, parsed)) {
            return false;
        }
        value_ = std::move(parsed);
        MarkSet(true);
        return true;
    }

    std::string ToString() const override { return FormatValue(value_); }
    std::string DefaultString() const override { return FormatValue(default_); }

    void Reset() override {
        value_ = default_;
        MarkSet(false);
    }

private:
    T value_;
    T default_;
};

using ChangeCallback = std::function<void(std::string_view value)>;

/**
 * Parse `--name=value`, `--name value` and bare `--name` (booleans only).
 * Dashes inside flag names are accepted as underscores. Everything after a
 * lone `--` is positional.
 *
 * @return Positional arguments in order of appearance
 */
std::vector<std::string> Init(int argc, char** argv);

/// Apply `GDX_<NAME>` environment variables to flags not set on the
/// command line.
void ApplyEnvironment();

/// Flags passed on the command line that are not registered.
const std::vector<std::string>& UnknownFlags();

/// Malformed values and missing arguments seen by Init.
const std::vector<std::string>& ParseErrors();

FlagBase* FindFlag(std::string_view name);
bool SetFlagByName(std::string_view name, std::string_view value);
void OnChange(std::string_view name, ChangeCallback callback);

/// Registered flags ordered by category, then name.
std::vector<FlagBase*> ListFlags();

/// Help text listing every flag with its default and description.
std::string Usage();

/// Restore defaults and clear unknown flags / parse errors.
void ResetAll();

}  // namespace gdx::cvar

#define GDXCVAR_DEFINE_BOOL(name, default_value, category, description) \
    ::gdx::cvar::Flag<bool> cvar_##name(#name, default_value, category, description)

#define GDXCVAR_DEFINE_INT32(name, default_value, category, description) \
    ::gdx::cvar::Flag<int32_t> cvar_##name(#name, default_value, category, description)

#define GDXCVAR_DEFINE_STRING(name, default_value, category, description) \
    ::gdx::cvar::Flag<std::string> cvar_##name(#name, std::string(default_value), category, description)

#define GDXCVAR_DECLARE_BOOL(name) extern ::gdx::cvar::Flag<bool> cvar_##name
#define GDXCVAR_DECLARE_INT32(name) extern ::gdx::cvar::Flag<int32_t> cvar_##name
#define GDXCVAR_DECLARE_STRING(name) extern ::gdx::cvar::Flag<std::string> cvar_##name

#define GDXCVAR_GET(name) (cvar_##name.value())
