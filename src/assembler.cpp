/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/assembler.hpp"
#include "tessera/logger.hpp"

namespace tessera {

AssembleReport assemble(const Job& job) {
    AssembleReport report;
    report.total = job.segments.size();

    std::size_t outputSize = 0;
    for (const auto& seg : job.segments) {
        switch (seg.status()) {
            case Status::Done:
                report.done.push_back(seg.index);
                outputSize += seg.result()->size();
                break;
            case Status::Error:
                report.errors.push_back(seg.index);
                break;
            default:
                report.pending.push_back(seg.index);
                break;
        }
    }

    if (report.done.empty()) {
        report.error = AssembleError::NothingToRebuild;
        report.message = "No completed segments found. Nothing to rebuild.";
        return report;
    }

    // Segments are stored in index order, so `done` is already ascending.
    report.output.reserve(outputSize);
    for (std::size_t index : report.done) {
        report.output += *job.segments[index].result();
    }

    report.ok = true;
    return report;
}

int exitCodeFor(AssembleError error) noexcept {
    switch (error) {
        case AssembleError::None: return kExitOk;
        case AssembleError::NothingToRebuild: return kExitNothingToDo;
        case AssembleError::NotFound:
        case AssembleError::InvalidJob:
        case AssembleError::IoError:
            break;
    }
    return kExitError;
}

Assembler::Assembler(const Store& store) noexcept : store_(store) {
}

AssembleReport Assembler::assemble(const DocumentId& id) const noexcept {
    AssembleReport report;
    try {
        LoadResult loaded = store_.load(id);
        if (!loaded) {
            report.error = loaded.error == StoreError::NotFound ? AssembleError::NotFound
                         : loaded.error == StoreError::IoError ? AssembleError::IoError
                         : AssembleError::InvalidJob;
            report.message = loaded.message;
            return report;
        }

        report = tessera::assemble(loaded.job);
        if (report) {
            LOG_INFO("Assembled " + std::to_string(report.done.size()) + "/" + std::to_string(report.total) +
                     " segments of " + id);
            if (report.missing() > 0) {
                LOG_WARN("Output for " + id + " is incomplete: " + std::to_string(report.missing()) +
                         " segment(s) missing");
            }
        } else {
            LOG_WARN(report.message);
        }
        return report;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to assemble " + id + ": " + std::string(e.what()));
        report = AssembleReport{};
        report.error = AssembleError::IoError;
        report.message = e.what();
        return report;
    }
}

bool Assembler::write(const AssembleReport& report, const std::filesystem::path& path,
                      std::string& error) const noexcept {
    if (!report) {
        error = "refusing to write an empty rebuild";
        return false;
    }
    if (!writeFileAtomic(path, report.output, error)) {
        LOG_ERROR("Failed to write " + path.string() + ": " + error);
        return false;
    }
    LOG_DEBUG("Wrote " + std::to_string(report.output.size()) + " bytes to " + path.string());
    return true;
}

std::filesystem::path Assembler::defaultOutputPath(const DocumentId& id) const {
    return store_.workspace() / (id + "_final.txt");
}

}
