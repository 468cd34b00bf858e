/**
 * @file        gdx/codegen/code_writer.h
 * @brief       Indentation-aware text builder for generated sources
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
#include <utility>

#include <fmt/format.h>

namespace gdx::codegen {

class CodeWriter {
public:
    static constexpr std::string_view kIndent = "    ";

    template <typename... Args>
    void print(fmt::format_string<Args...> format, Args&&... args) {
        write(fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void println(fmt::format_string<Args...> format, Args&&... args) {
        write(fmt::format(format, std::forward<Args>(args)...));
        write("\n");
    }

    void println() { write("\n"); }

    /// Line `header {` followed by an indented block.
    void open(std::string_view header);

    /// Ends the block started by open(); `suffix` follows the brace (`;`, `,`).
    void close(std::string_view suffix = "");

    void indent() { ++depth_; }
    void dedent();

    /// Insert pre-rendered text, re-indented to the current depth.
    void append(std::string_view text) { write(text); }

    int depth() const { return depth_; }
    bool empty() const { return out_.empty(); }
    const std::string& str() const { return out_; }

    /// Return the buffered text and reset the writer.
    std::string take();

private:
    void write(std::string_view text);

    std::string out_;
    int depth_ = 0;
    bool at_line_start_ = true;
};

}  // namespace gdx::codegen
