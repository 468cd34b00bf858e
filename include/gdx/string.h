/**
 * @file        gdx/string.h
 * @brief       ASCII string helpers
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

namespace gdx::string {

std::string to_lower_ascii(std::string_view source);
std::string to_upper_ascii(std::string_view source);

inline bool starts_with(std::string_view sv, std::string_view prefix) {
    return sv.substr(0, prefix.size()) == prefix;
}

inline bool ends_with(std::string_view sv, std::string_view suffix) {
    return sv.size() >= suffix.size() && sv.substr(sv.size() - suffix.size()) == suffix;
}

std::string_view trim_left(std::string_view sv, std::string_view chars = " \t\r\n");
std::string_view trim_right(std::string_view sv, std::string_view chars = " \t\r\n");
std::string_view trim(std::string_view sv, std::string_view chars = " \t\r\n");
std::string trim_string(std::string_view sv, std::string_view chars = " \t\r\n");

/// Split on every occurrence of `delimiter`; empty pieces are kept.
std::vector<std::string_view> split(std::string_view sv, char delimiter);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

std::string replace_all(std::string_view source, std::string_view from, std::string_view to);

}  // namespace gdx::string
