/**
 * @file        core/string.cpp
 * @brief       ASCII string helpers
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/string.h>

#include <algorithm>

namespace gdx::string {

namespace {

char lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }
char upper(char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

}  // namespace

std::string to_lower_ascii(std::string_view source) {
    std::string result(source);
    std::transform(result.begin(), result.end(), result.begin(), lower);
    return result;
}

std::string to_upper_ascii(std::string_view source) {
    std::string result(source);
    std::transform(result.begin(), result.end(), result.begin(), upper);
    return result;
}

std::string_view trim_left(std::string_view sv, std::string_view chars) {
    auto start = sv.find_first_not_of(chars);
    return start == std::string_view::npos ? std::string_view{} : sv.substr(start);
}

std::string_view trim_right(std::string_view sv, std::string_view chars) {
    auto end = sv.find_last_not_of(chars);
    return end == std::string_view::npos ? std::string_view{} : sv.substr(0, end + 1);
}

std::string_view trim(std::string_view sv, std::string_view chars) {
    return trim_right(trim_left(sv, chars), chars);
}

std::string trim_string(std::string_view sv, std::string_view chars) {
    return std::string(trim(sv, chars));
}

std::vector<std::string_view> split(std::string_view sv, char delimiter) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = sv.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(sv.substr(start));
            break;
        }
        parts.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string replace_all(std::string_view source, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return std::string(source);
    }
    std::string result;
    size_t start = 0;
    while (true) {
        size_t pos = source.find(from, start);
        if (pos == std::string_view::npos) {
            result += source.substr(start);
            break;
        }
        result += source.substr(start, pos - start);
        result += to;
        start = pos + from.size();
    }
    return result;
}

}  // namespace gdx::string
