/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/processor.hpp"
#include "tessera/logger.hpp"
#include <cstring>
#include <sstream>

namespace tessera {

namespace {

void fillSummary(RunSummary& summary, const Progress& progress, Progress::Clock::time_point now) {
    summary.total = progress.total();
    summary.alreadyDone = progress.alreadyDone();
    summary.attempted = progress.attempted();
    summary.succeeded = progress.succeeded();
    summary.failed = progress.failed();
    summary.failedIndices = progress.failedIndices();
    summary.elapsed = now - progress.start();
}

void appendIndices(std::ostringstream& ss, const std::vector<std::size_t>& indices) {
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << indices[i];
    }
}

}

std::string formatSummary(const RunSummary& summary) {
    std::ostringstream ss;
    ss << "Summary:\n";
    ss << "- Total segments: " << summary.total << "\n";
    ss << "- Completed: " << (summary.alreadyDone + summary.succeeded)
       << " (" << summary.succeeded << " this run)\n";
    ss << "- Failed: " << summary.failed;
    if (!summary.failedIndices.empty()) {
        ss << " (segments: ";
        appendIndices(ss, summary.failedIndices);
        ss << ")";
    }
    if (!summary.exhaustedIndices.empty()) {
        ss << "\n- Gave up after max attempts: " << summary.exhaustedIndices.size() << " (segments: ";
        appendIndices(ss, summary.exhaustedIndices);
        ss << ")";
    }
    ss << "\n- Processing time: "
       << formatDuration(std::chrono::duration_cast<std::chrono::seconds>(summary.elapsed));
    return ss.str();
}

int exitCodeFor(ProcessResult result) noexcept {
    switch (result) {
        case ProcessResult::Completed: return kExitOk;
        case ProcessResult::Idle: return kExitNothingToDo;
        case ProcessResult::SystemError: return kExitPersistence;
        case ProcessResult::NotFound:
        case ProcessResult::InvalidJob:
            break;
    }
    return kExitError;
}

std::string renderPrompt(const std::string& promptTemplate, const std::string& text) {
    const std::size_t placeholderLen = std::strlen(kPromptPlaceholder);
    std::string prompt;
    prompt.reserve(promptTemplate.size() + text.size());

    std::size_t pos = 0;
    while (true) {
        std::size_t found = promptTemplate.find(kPromptPlaceholder, pos);
        if (found == std::string::npos) {
            prompt.append(promptTemplate, pos, std::string::npos);
            break;
        }
        prompt.append(promptTemplate, pos, found - pos);
        prompt.append(text);
        pos = found + placeholderLen;
    }
    return prompt;
}

Processor::Processor(const Store& store, Generator& generator) noexcept
    : store_(store), generator_(generator) {
    LOG_DEBUG("Processor created for workspace: " + store_.workspace().string());
}

ScanResult Processor::scan(const Job& job, std::uint32_t maxAttempts) {
    ScanResult result;
    for (const auto& seg : job.segments) {
        switch (seg.status()) {
            case Status::Done:
                ++result.done;
                break;
            case Status::Error:
                if (maxAttempts > 0 && seg.attempts >= maxAttempts) {
                    result.exhausted.push_back(seg.index);
                } else {
                    result.pending.push_back(seg.index);
                }
                break;
            default:
                result.pending.push_back(seg.index);
                break;
        }
    }
    return result;
}

ProcessReport Processor::process(const DocumentId& id, const RunOptions& options) noexcept {
    ProcessReport report;

    try {
        LoadResult loaded = store_.load(id);
        if (!loaded) {
            report.result = loaded.error == StoreError::NotFound ? ProcessResult::NotFound
                          : loaded.error == StoreError::IoError ? ProcessResult::SystemError
                          : ProcessResult::InvalidJob;
            report.message = loaded.message;
            return report;
        }
        Job& job = loaded.job;

        ScanResult work = scan(job, options.maxAttempts);
        report.summary.total = job.segments.size();
        report.summary.alreadyDone = work.done;
        report.summary.exhaustedIndices = work.exhausted;

        LOG_INFO("Job " + id + ": " + std::to_string(job.segments.size()) + " segments, " +
                 std::to_string(work.pending.size()) + " pending, " +
                 std::to_string(work.done) + " already done");
        if (!work.exhausted.empty()) {
            LOG_WARN(std::to_string(work.exhausted.size()) + " segment(s) reached the limit of " +
                     std::to_string(options.maxAttempts) + " attempts and will not be retried");
        }

        if (work.pending.empty()) {
            report.result = ProcessResult::Idle;
            report.message = "Nothing to process";
            return report;
        }

        if (options.promptTemplate.find(kPromptPlaceholder) == std::string::npos) {
            LOG_WARN(std::string("Prompt template has no ") + kPromptPlaceholder +
                     " placeholder; every segment will receive the same prompt");
        }

        Progress progress(job.segments.size(), work.done, work.pending.size());

        for (std::size_t index : work.pending) {
            Segment& seg = job.segments[index];
            notify(seg, progress, SegmentEvent::Started);

            RunResult outcome = submit(renderPrompt(options.promptTemplate, seg.text));
            ++seg.attempts;

            const bool success = outcome.ok && !outcome.output.empty();
            if (success) {
                seg.state = Done{std::move(outcome.output)};
                LOG_DEBUG("Segment " + std::to_string(index) + " done");
            } else {
                std::string detail = outcome.ok ? "empty response from generator"
                                   : outcome.error.empty() ? "unknown generation error"
                                   : outcome.error;
                LOG_WARN("Segment " + std::to_string(index) + " failed: " + detail);
                seg.state = Error{std::move(detail)};
            }

            progress.record(index, success);

            SaveResult saved = store_.save(job);
            if (!saved) {
                fillSummary(report.summary, progress, Progress::Clock::now());
                report.result = ProcessResult::SystemError;
                report.message = "Failed to persist job after segment " + std::to_string(index) +
                                 ": " + saved.message;
                LOG_ERROR(report.message);
                return report;
            }

            notify(seg, progress, SegmentEvent::Finished);
        }

        fillSummary(report.summary, progress, Progress::Clock::now());
        report.result = ProcessResult::Completed;
        LOG_INFO("Run finished for " + id + ": " + std::to_string(progress.succeeded()) + " succeeded, " +
                 std::to_string(progress.failed()) + " failed");
        return report;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + id + ": " + std::string(e.what()));
        report.result = ProcessResult::SystemError;
        report.message = "Internal processing error: " + std::string(e.what());
        return report;
    }
}

RunResult Processor::submit(const std::string& prompt) noexcept {
    try {
        return generator_.run(prompt);
    } catch (const std::exception& e) {
        return {false, "", "Generator error: " + std::string(e.what())};
    } catch (...) {
        return {false, "", "Unknown generator error"};
    }
}

void Processor::notify(const Segment& segment, const Progress& progress, SegmentEvent event) noexcept {
    if (!observer_) {
        return;
    }
    try {
        observer_(segment, progress, event);
    } catch (const std::exception& e) {
        LOG_WARN("Progress observer error: " + std::string(e.what()));
    }
}

}
