/**
 * @file        codegen/emitter.cpp
 * @brief       Buffered writer for generated files
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/codegen/emitter.h>
#include <gdx/logging.h>

#include <cstdio>
#include <cstdint>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <xxhash.h>

namespace gdx::codegen {

bool FileContentMatches(const std::filesystem::path& path, std::string_view content) {
    FILE* f = fopen(path.string().c_str(), "rb");
    if (!f) {
        return false;
    }

    bool matches = false;
    fseek(f, 0, SEEK_END);
    long fileSize = ftell(f);
    if (fileSize == static_cast<long>(content.size())) {
        fseek(f, 0, SEEK_SET);
        std::vector<uint8_t> temp(static_cast<size_t>(fileSize));
        size_t read = fread(temp.data(), 1, temp.size(), f);
        if (read == temp.size()) {
            matches = XXH128_isEqual(XXH3_128bits(temp.data(), temp.size()),
                                     XXH3_128bits(content.data(), content.size()));
        }
    }
    fclose(f);
    return matches;
}

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

void Emitter::submit(std::filesystem::path relative_path, std::string content) {
    pending_writes_.emplace_back(std::move(relative_path), std::move(content));
}

Result<Emitter::FlushStats> Emitter::flush() {
    FlushStats stats;

    for (const auto& [relative_path, content] : pending_writes_) {
        auto filePath = output_dir_ / relative_path;
        GDXCODEGEN_TRACE("flush: filePath={}", filePath.string());

        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            pending_writes_.clear();
            return Err<FlushStats>(ErrorCategory::IO,
                                   fmt::format("Failed to create directory {}: {}",
                                               filePath.parent_path().string(), ec.message()));
        }

        if (FileContentMatches(filePath, content)) {
            ++stats.unchanged;
            continue;
        }

        FILE* f = fopen(filePath.string().c_str(), "wb");
        if (!f) {
            pending_writes_.clear();
            return Err<FlushStats>(ErrorCategory::IO,
                                   fmt::format("Failed to open file for writing: {}", filePath.string()));
        }
        size_t written = fwrite(content.data(), 1, content.size(), f);
        int close_result = fclose(f);
        if (written != content.size() || close_result != 0) {
            pending_writes_.clear();
            return Err<FlushStats>(ErrorCategory::IO,
                                   fmt::format("Failed to write {}", filePath.string()));
        }

        ++stats.written;
        GDXCODEGEN_TRACE("Wrote {} bytes to {}", content.size(), filePath.string());
    }

    pending_writes_.clear();
    GDXCODEGEN_DEBUG("flush: {} written, {} unchanged", stats.written, stats.unchanged);
    return stats;
}

}  // namespace gdx::codegen
