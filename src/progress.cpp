/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/progress.hpp"
#include <iomanip>
#include <sstream>

namespace tessera {

Progress::Progress(std::size_t total, std::size_t alreadyDone, std::size_t pending,
                   Clock::time_point start) noexcept
    : total_(total), alreadyDone_(alreadyDone), pending_(pending), start_(start) {
}

void Progress::record(std::size_t index, bool success) {
    if (success) {
        ++succeeded_;
    } else {
        ++failed_;
        failedIndices_.push_back(index);
    }
}

double Progress::speedPerMinute(Clock::time_point now) const noexcept {
    const double elapsed = std::chrono::duration<double>(now - start_).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(attempted()) * 60.0 / elapsed;
}

std::optional<std::chrono::seconds> Progress::eta(Clock::time_point now) const noexcept {
    const double elapsed = std::chrono::duration<double>(now - start_).count();
    if (attempted() == 0 || elapsed <= 0.0) {
        return std::nullopt;
    }
    // remaining / (attempted / elapsed)
    const double seconds = static_cast<double>(remaining()) * elapsed / static_cast<double>(attempted());
    return std::chrono::seconds(static_cast<long long>(seconds));
}

std::string Progress::bar(std::size_t width) const {
    const std::size_t filled = pending_ == 0 ? width : attempted() * width / pending_;
    return std::string(filled, '#') + std::string(width - filled, '-');
}

std::string Progress::statusLine(Clock::time_point now) const {
    std::ostringstream ss;
    ss << "Processing: [" << bar() << "] " << attempted() << "/" << pending_ << " segments"
       << " | ok " << succeeded_ << " | failed " << failed_
       << " | Speed: " << std::fixed << std::setprecision(1) << speedPerMinute(now) << "/min"
       << " | ETA: ";
    auto remainingTime = eta(now);
    if (remainingTime) {
        ss << formatDuration(*remainingTime);
    } else {
        ss << "calculating...";
    }
    return ss.str();
}

std::string formatDuration(std::chrono::seconds duration) {
    long long total = duration.count();
    if (total < 0) total = 0;
    std::ostringstream ss;
    ss << total / 3600 << ":" << std::setfill('0') << std::setw(2) << (total / 60) % 60
       << ":" << std::setw(2) << total % 60;
    return ss.str();
}

}
