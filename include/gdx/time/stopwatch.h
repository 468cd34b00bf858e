/**
 * @file        gdx/time/stopwatch.h
 * @brief       Phase timing for generation runs
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gdx/result.h>

namespace gdx::time {

/// Records the time spent between consecutive checkpoints.
class StopWatch {
public:
    using clock = std::chrono::steady_clock;
    using duration = std::chrono::microseconds;

    static StopWatch Start();

    /// Store the time elapsed since the previous checkpoint under `what`.
    void record(std::string_view what);

    const std::vector<std::pair<std::string, duration>>& metrics() const { return metrics_; }
    duration total() const;

    /// Plain-text table: one line per checkpoint followed by the total.
    std::string format_stats() const;

    Result<void> write_stats_to(const std::filesystem::path& path) const;

private:
    StopWatch() = default;

    clock::time_point start_;
    clock::time_point last_;
    std::vector<std::pair<std::string, duration>> metrics_;
};

}  // namespace gdx::time
