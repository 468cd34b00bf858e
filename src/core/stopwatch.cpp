/**
 * @file        core/stopwatch.cpp
 * @brief       Phase timing for generation runs
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/time/stopwatch.h>

#include <algorithm>
#include <fstream>

#include <fmt/format.h>

namespace gdx::time {

StopWatch StopWatch::Start() {
    StopWatch watch;
    watch.start_ = clock::now();
    watch.last_ = watch.start_;
    return watch;
}

void StopWatch::record(std::string_view what) {
    auto now = clock::now();
    metrics_.emplace_back(std::string(what), std::chrono::duration_cast<duration>(now - last_));
    last_ = now;
}

StopWatch::duration StopWatch::total() const {
    duration sum{0};
    for (const auto& [name, elapsed] : metrics_) {
        sum += elapsed;
    }
    return sum;
}

std::string StopWatch::format_stats() const {
    size_t width = 5;  // "total"
    for (const auto& [name, elapsed] : metrics_) {
        width = std::max(width, name.size());
    }

    std::string out = "Code generation timings:\n";
    for (const auto& [name, elapsed] : metrics_) {
        out += fmt::format("  {:<{}}  {:>10.3f} ms\n", name, width, elapsed.count() / 1000.0);
    }
    out += fmt::format("  {:<{}}  {:>10.3f} ms\n", "total", width, total().count() / 1000.0);
    return out;
}

Result<void> StopWatch::write_stats_to(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Err(ErrorCategory::IO, fmt::format("Failed to open stats file {}", path.string()));
    }
    file << format_stats();
    if (!file) {
        return Err(ErrorCategory::IO, fmt::format("Failed to write stats file {}", path.string()));
    }
    return Ok();
}

}  // namespace gdx::time
