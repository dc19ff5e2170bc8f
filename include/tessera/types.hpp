/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tessera {

// Document identifier; also the stem of the job file in the workspace.
using DocumentId = std::string;

// Segment lifecycle states. Exactly one alternative is held at a time.
struct Pending {};
struct Done { std::string result; };
struct Error { std::string detail; };

using SegmentState = std::variant<Pending, Done, Error>;

// Order matches the SegmentState alternatives.
enum class Status : std::uint8_t { Pending = 0, Done = 1, Error = 2 };

struct Segment {
    std::size_t index = 0;
    std::string text;
    SegmentState state;
    std::uint32_t attempts = 0;

    [[nodiscard]] Status status() const noexcept { return static_cast<Status>(state.index()); }
    [[nodiscard]] bool isDone() const noexcept { return std::holds_alternative<Done>(state); }

    [[nodiscard]] const std::string* result() const noexcept {
        const auto* done = std::get_if<Done>(&state);
        return done ? &done->result : nullptr;
    }
    [[nodiscard]] const std::string* errorDetail() const noexcept {
        const auto* err = std::get_if<Error>(&state);
        return err ? &err->detail : nullptr;
    }
};

struct JobMeta {
    DocumentId documentId;
    std::size_t chunkSize = 0;
    std::size_t totalChunks = 0;
};

struct Job {
    JobMeta meta;
    std::vector<Segment> segments;
};

// Exit statuses shared by the command-line tools.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNothingToDo = 2;
constexpr int kExitPersistence = 3;

[[nodiscard]] const char* statusToString(Status status) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(std::string_view value) noexcept;

} // namespace tessera
