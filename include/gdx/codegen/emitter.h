/**
 * @file        gdx/codegen/emitter.h
 * @brief       Buffered writer for generated files
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gdx/result.h>

namespace gdx::codegen {

/// First line of every generated Rust file.
inline constexpr std::string_view kGeneratedHeader = "// Generated by gdxgen. Do not edit.\n";

/**
 * Queues generated files and writes them in one pass.
 *
 * Files whose content matches what is already on disk are left untouched
 * so that downstream builds do not see a new timestamp.
 */
class Emitter {
public:
    struct FlushStats {
        size_t written = 0;
        size_t unchanged = 0;
    };

    explicit Emitter(std::filesystem::path output_dir);

    const std::filesystem::path& output_dir() const { return output_dir_; }

    /// Queue `content` for `relative_path` (relative to the output directory).
    void submit(std::filesystem::path relative_path, std::string content);

    size_t pending() const { return pending_writes_.size(); }

    /**
     * Write every queued file and clear the queue.
     *
     * Stops at the first directory or file that cannot be written.
     */
    Result<FlushStats> flush();

private:
    std::filesystem::path output_dir_;
    std::vector<std::pair<std::filesystem::path, std::string>> pending_writes_;
};

/// True when `path` exists and holds exactly `content`.
bool FileContentMatches(const std::filesystem::path& path, std::string_view content);

}  // namespace gdx::codegen
