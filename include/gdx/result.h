/**
 * @file        gdx/result.h
 * @brief       Result type for fallible operations
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace gdx {

enum class ErrorCategory {
    IO,          // File system access
    Parse,       // Malformed input document
    Validation,  // Input is well-formed but violates an invariant
    Internal,
};

const char* ErrorCategoryName(ErrorCategory category);

struct Error {
    ErrorCategory category = ErrorCategory::Internal;
    std::string message;

    const char* what() const { return message.c_str(); }
};

/**
 * Value-or-error return type.
 *
 * Converts to true when a value is present. Accessing the value of an
 * errored result (or the error of a successful one) is undefined.
 */
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

    explicit operator bool() const { return storage_.index() == 0; }
    bool ok() const { return storage_.index() == 0; }

    T& value() & { return std::get<0>(storage_); }
    const T& value() const& { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(storage_); }

private:
    std::variant<T, Error> storage_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    explicit operator bool() const { return !error_.has_value(); }
    bool ok() const { return !error_.has_value(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

inline Result<void> Ok() { return Result<void>(); }

template <typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T = void>
Result<T> Err(ErrorCategory category, std::string message) {
    return Result<T>(Error{category, std::move(message)});
}

template <typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

}  // namespace gdx
