/**
 * @file        codegen/code_writer.cpp
 * @brief       Indentation-aware text builder for generated sources
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/code_writer.h>
#include <gdx/logging.h>

namespace gdx::codegen {

void CodeWriter::open(std::string_view header) {
    println("{} {{", header);
    indent();
}

void CodeWriter::close(std::string_view suffix) {
    dedent();
    println("}}{}", suffix);
}

void CodeWriter::dedent() {
    if (depth_ == 0) {
        GDX_FATAL("CodeWriter::dedent() without matching indent()");
    }
    --depth_;
}

std::string CodeWriter::take() {
    std::string result = std::move(out_);
    out_.clear();
    depth_ = 0;
    at_line_start_ = true;
    return result;
}

void CodeWriter::write(std::string_view text) {
    for (char c : text) {
        if (c == '\n') {
            out_.push_back('\n');
            at_line_start_ = true;
            continue;
        }
        if (at_line_start_) {
            for (int i = 0; i < depth_; ++i) {
                out_.append(kIndent);
            }
            at_line_start_ = false;
        }
        out_.push_back(c);
    }
}

}  // namespace gdx::codegen
