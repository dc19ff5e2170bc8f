/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "tessera/store.hpp"
#include "tessera/types.hpp"

namespace tessera {

enum class AssembleError : uint8_t {
    None = 0,
    NotFound,
    InvalidJob,
    NothingToRebuild,
    IoError
};

struct AssembleReport {
    bool ok = false;
    std::string output;
    std::size_t total = 0;
    std::vector<std::size_t> done;
    std::vector<std::size_t> errors;
    std::vector<std::size_t> pending;
    AssembleError error = AssembleError::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }
    [[nodiscard]] std::size_t missing() const noexcept { return errors.size() + pending.size(); }
    [[nodiscard]] bool complete() const noexcept { return ok && missing() == 0; }
};

// Joins the results of done segments in index order. Incomplete segments are
// reported, not fatal; only a job with no done segment fails.
[[nodiscard]] AssembleReport assemble(const Job& job);

// None 0, NothingToRebuild 2, anything else 1.
[[nodiscard]] int exitCodeFor(AssembleError error) noexcept;

class Assembler {
public:
    explicit Assembler(const Store& store) noexcept;

    Assembler(const Assembler&) = delete;
    Assembler& operator=(const Assembler&) = delete;

    [[nodiscard]] AssembleReport assemble(const DocumentId& id) const noexcept;

    // Writes report.output atomically; returns false on I/O failure.
    [[nodiscard]] bool write(const AssembleReport& report, const std::filesystem::path& path,
                             std::string& error) const noexcept;

    [[nodiscard]] std::filesystem::path defaultOutputPath(const DocumentId& id) const;

private:
    const Store& store_;
};

}
