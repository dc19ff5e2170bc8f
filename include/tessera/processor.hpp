/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "tessera/generator.hpp"
#include "tessera/progress.hpp"
#include "tessera/store.hpp"
#include "tessera/types.hpp"

namespace tessera {

enum class ProcessResult : uint8_t {
    Completed,
    Idle,
    NotFound,
    InvalidJob,
    SystemError
};

enum class SegmentEvent : uint8_t {
    Started,
    Finished
};

struct RunOptions {
    std::string promptTemplate;
    // Error segments stop being retried after this many submissions; 0 = no cap.
    std::uint32_t maxAttempts = 3;
};

struct RunSummary {
    std::size_t total = 0;
    std::size_t alreadyDone = 0;
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::vector<std::size_t> failedIndices;
    std::vector<std::size_t> exhaustedIndices;
    std::chrono::duration<double> elapsed{0.0};
};

struct ProcessReport {
    ProcessResult result = ProcessResult::SystemError;
    RunSummary summary;
    std::string message;
    explicit operator bool() const noexcept {
        return result == ProcessResult::Completed || result == ProcessResult::Idle;
    }
};

struct ScanResult {
    std::vector<std::size_t> pending;
    std::vector<std::size_t> exhausted;
    std::size_t done = 0;
};

// Called before each submission and again once its outcome is persisted.
using ProgressObserver = std::function<void(const Segment&, const Progress&, SegmentEvent)>;

// Advances a stored Job through a Generator, one segment at a time, saving
// the whole Job after every segment. Re-running resumes from what is left.
class Processor {
public:
    Processor(const Store& store, Generator& generator) noexcept;

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    void setObserver(ProgressObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] ProcessReport process(const DocumentId& id, const RunOptions& options) noexcept;

    [[nodiscard]] static ScanResult scan(const Job& job, std::uint32_t maxAttempts);

private:
    [[nodiscard]] RunResult submit(const std::string& prompt) noexcept;
    void notify(const Segment& segment, const Progress& progress, SegmentEvent event) noexcept;

    const Store& store_;
    Generator& generator_;
    ProgressObserver observer_;
};

// Substitute every "{text}" in the template with the segment text.
[[nodiscard]] std::string renderPrompt(const std::string& promptTemplate, const std::string& text);

constexpr const char* kPromptPlaceholder = "{text}";

// Completed 0, Idle 2, SystemError 3, anything else 1.
[[nodiscard]] int exitCodeFor(ProcessResult result) noexcept;

// Multi-line end-of-run report: totals, failed and exhausted indices, elapsed time.
[[nodiscard]] std::string formatSummary(const RunSummary& summary);

}
