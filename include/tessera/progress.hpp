/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

// Counters and timing for one processing run. Times are passed in so the
// derived figures are reproducible.
class Progress {
public:
    using Clock = std::chrono::steady_clock;

    Progress(std::size_t total, std::size_t alreadyDone, std::size_t pending,
             Clock::time_point start = Clock::now()) noexcept;

    void record(std::size_t index, bool success);

    [[nodiscard]] std::size_t total() const noexcept { return total_; }
    [[nodiscard]] std::size_t alreadyDone() const noexcept { return alreadyDone_; }
    [[nodiscard]] std::size_t pending() const noexcept { return pending_; }
    [[nodiscard]] std::size_t attempted() const noexcept { return succeeded_ + failed_; }
    [[nodiscard]] std::size_t succeeded() const noexcept { return succeeded_; }
    [[nodiscard]] std::size_t failed() const noexcept { return failed_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return pending_ - attempted(); }
    [[nodiscard]] const std::vector<std::size_t>& failedIndices() const noexcept { return failedIndices_; }
    [[nodiscard]] Clock::time_point start() const noexcept { return start_; }

    // Segments per minute since start; 0 until something was attempted.
    [[nodiscard]] double speedPerMinute(Clock::time_point now) const noexcept;
    [[nodiscard]] std::optional<std::chrono::seconds> eta(Clock::time_point now) const noexcept;
    [[nodiscard]] std::string bar(std::size_t width = 20) const;
    [[nodiscard]] std::string statusLine(Clock::time_point now) const;

private:
    std::size_t total_;
    std::size_t alreadyDone_;
    std::size_t pending_;
    std::size_t succeeded_ = 0;
    std::size_t failed_ = 0;
    std::vector<std::size_t> failedIndices_;
    Clock::time_point start_;
};

// H:MM:SS
[[nodiscard]] std::string formatDuration(std::chrono::seconds duration);

}
