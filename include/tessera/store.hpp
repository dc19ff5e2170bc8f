/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tessera/types.hpp"

namespace tessera {

enum class StoreError : uint8_t {
    None = 0,
    NotFound,
    Malformed,
    InvalidArgument,
    AlreadyExists,
    IoError
};

enum class CreateMode : uint8_t {
    Overwrite,
    FailIfExists
};

struct LoadResult {
    bool ok = false;
    Job job;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct SaveResult {
    bool ok = false;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct Artifact {
    std::filesystem::path workspace;
    DocumentId documentId;
};

// Persists one Job per document as <workspace>/<document_id>_chunked.json.
// Every save rewrites the whole file through a temp file and a rename.
class Store final {
public:
    explicit Store(const std::filesystem::path& workspace) noexcept;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) noexcept = default;
    Store& operator=(Store&&) noexcept = default;

    [[nodiscard]] LoadResult create(const DocumentId& id, const std::vector<std::string>& segments,
                                    std::size_t chunkSize, CreateMode mode = CreateMode::Overwrite) const;
    [[nodiscard]] LoadResult load(const DocumentId& id) const noexcept;
    [[nodiscard]] SaveResult save(const Job& job) const noexcept;

    [[nodiscard]] bool exists(const DocumentId& id) const noexcept;
    [[nodiscard]] std::filesystem::path pathFor(const DocumentId& id) const;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

    // Maps ".../<id>_chunked.json" back to its workspace and document id.
    [[nodiscard]] static std::optional<Artifact> resolveArtifact(const std::filesystem::path& file);
    [[nodiscard]] static bool isValidDocumentId(const DocumentId& id) noexcept;

    static constexpr const char* kSuffix = "_chunked.json";

private:
    std::filesystem::path workspace_;
};

// Serialization of the persisted record; exposed for tests and tooling.
[[nodiscard]] std::string serializeJob(const Job& job);
[[nodiscard]] LoadResult parseJob(const std::string& content);

// Write content to path via <path>.tmp and rename. Returns false and fills
// `error` on failure; the target is left untouched in that case.
[[nodiscard]] bool writeFileAtomic(const std::filesystem::path& path, const std::string& content,
                                   std::string& error) noexcept;

}
