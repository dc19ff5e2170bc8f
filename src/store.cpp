/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/store.hpp"
#include "tessera/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace tessera {

namespace {

using json = nlohmann::ordered_json;

struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::size_t requireUnsigned(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_unsigned()) {
        throw FormatError(std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<std::size_t>();
}

const std::string* optionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return nullptr;
    }
    return it->get_ptr<const std::string*>();
}

Segment parseSegment(const json& chunk, std::size_t position) {
    if (!chunk.is_object()) {
        throw FormatError("chunk " + std::to_string(position) + " is not an object");
    }

    Segment seg;
    seg.index = requireUnsigned(chunk, "index");
    if (seg.index != position) {
        throw FormatError("chunk at position " + std::to_string(position) +
                          " has index " + std::to_string(seg.index));
    }

    const std::string* text = optionalString(chunk, "text");
    if (!text) {
        throw FormatError("chunk " + std::to_string(position) + " has no text");
    }
    seg.text = *text;

    const std::string* statusText = optionalString(chunk, "status");
    auto status = statusText ? parseStatus(*statusText) : std::nullopt;
    if (!status) {
        throw FormatError("chunk " + std::to_string(position) + " has an invalid status");
    }

    if (chunk.contains("attempts")) {
        seg.attempts = static_cast<std::uint32_t>(requireUnsigned(chunk, "attempts"));
    }

    switch (*status) {
        case Status::Done:
            if (const std::string* result = optionalString(chunk, "result")) {
                seg.state = Done{*result};
            } else {
                LOG_WARN("Chunk " + std::to_string(position) + " is marked done without a result; treating as pending");
                seg.state = Pending{};
            }
            break;
        case Status::Error: {
            const std::string* detail = optionalString(chunk, "error_detail");
            if (!detail) {
                detail = optionalString(chunk, "error");
            }
            seg.state = Error{detail ? *detail : std::string("unknown error")};
            break;
        }
        default:
            seg.state = Pending{};
            break;
    }
    return seg;
}

LoadResult failure(StoreError code, const std::string& message) {
    LoadResult out;
    out.error = code;
    out.message = message;
    return out;
}

}

std::string serializeJob(const Job& job) {
    json chunks = json::array();
    for (const auto& seg : job.segments) {
        json chunk;
        chunk["index"] = seg.index;
        chunk["text"] = seg.text;
        chunk["status"] = statusToString(seg.status());
        const std::string* result = seg.result();
        const std::string* detail = seg.errorDetail();
        chunk["result"] = result ? json(*result) : json(nullptr);
        chunk["error_detail"] = detail ? json(*detail) : json(nullptr);
        chunk["attempts"] = seg.attempts;
        chunks.push_back(std::move(chunk));
    }

    json root;
    root["meta"] = {
        {"document_id", job.meta.documentId},
        {"chunk_size", job.meta.chunkSize},
        {"total_chunks", job.segments.size()}
    };
    root["chunks"] = std::move(chunks);

    // Generator output can end in a truncated UTF-8 sequence; replace rather
    // than refuse to persist it.
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

LoadResult parseJob(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        return failure(StoreError::Malformed, std::string("invalid JSON: ") + e.what());
    }

    try {
        if (!root.is_object() || !root.contains("meta") || !root.contains("chunks")) {
            throw FormatError("expected an object with 'meta' and 'chunks'");
        }
        const json& meta = root.at("meta");
        const json& chunks = root.at("chunks");
        if (!meta.is_object() || !chunks.is_array()) {
            throw FormatError("'meta' must be an object and 'chunks' an array");
        }

        LoadResult out;
        const std::string* id = optionalString(meta, "document_id");
        if (!id) {
            id = optionalString(meta, "book_id");
        }
        if (!id) {
            throw FormatError("meta has no document_id");
        }
        out.job.meta.documentId = *id;
        out.job.meta.chunkSize = requireUnsigned(meta, "chunk_size");
        out.job.meta.totalChunks = meta.contains("total_chunks") ? requireUnsigned(meta, "total_chunks") : chunks.size();
        if (out.job.meta.totalChunks != chunks.size()) {
            throw FormatError("total_chunks is " + std::to_string(out.job.meta.totalChunks) +
                              " but " + std::to_string(chunks.size()) + " chunks are present");
        }

        out.job.segments.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            out.job.segments.push_back(parseSegment(chunks[i], i));
        }

        out.ok = true;
        return out;
    } catch (const FormatError& e) {
        return failure(StoreError::Malformed, e.what());
    } catch (const json::exception& e) {
        return failure(StoreError::Malformed, e.what());
    }
}

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content,
                     std::string& error) noexcept {
    std::filesystem::path tempPath;
    try {
        tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                error = "cannot open " + tempPath.string() + " for writing";
                return false;
            }
            file << content;
            file.flush();
            if (!file.good()) {
                error = "short write to " + tempPath.string();
                file.close();
                std::error_code ignored;
                std::filesystem::remove(tempPath, ignored);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            error = "cannot replace " + path.string() + ": " + ec.message();
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return false;
    }
}

Store::Store(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
}

LoadResult Store::create(const DocumentId& id, const std::vector<std::string>& segments,
                         std::size_t chunkSize, CreateMode mode) const {
    if (!isValidDocumentId(id)) {
        return failure(StoreError::InvalidArgument, "Invalid document id: '" + id + "'");
    }
    if (chunkSize == 0) {
        return failure(StoreError::InvalidArgument, "Chunk size must be at least 1");
    }
    if (mode == CreateMode::FailIfExists && exists(id)) {
        return failure(StoreError::AlreadyExists, "Job already exists: " + pathFor(id).string());
    }

    std::error_code ec;
    std::filesystem::create_directories(workspace_, ec);
    if (ec) {
        return failure(StoreError::IoError, "Failed to create workspace " + workspace_.string() + ": " + ec.message());
    }

    LoadResult out;
    out.job.meta = JobMeta{id, chunkSize, segments.size()};
    out.job.segments.reserve(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i) {
        Segment seg;
        seg.index = i;
        seg.text = segments[i];
        out.job.segments.push_back(std::move(seg));
    }

    SaveResult saved = save(out.job);
    if (!saved) {
        return failure(saved.error, saved.message);
    }

    LOG_INFO("Created job " + id + " with " + std::to_string(segments.size()) + " segments");
    out.ok = true;
    return out;
}

LoadResult Store::load(const DocumentId& id) const noexcept {
    try {
        if (!isValidDocumentId(id)) {
            return failure(StoreError::InvalidArgument, "Invalid document id: '" + id + "'");
        }

        auto path = pathFor(id);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            LOG_DEBUG("Job file not found: " + path.string());
            return failure(StoreError::NotFound, "Job not found: " + path.string());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return failure(StoreError::IoError, "Failed to open " + path.string());
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        LoadResult out = parseJob(content);
        if (!out) {
            LOG_ERROR("Malformed job file " + path.string() + ": " + out.message);
            out.message = "Malformed job file " + path.string() + ": " + out.message;
            return out;
        }
        // The file name is authoritative so saves land back on the same file.
        if (out.job.meta.documentId != id) {
            LOG_WARN("Job file " + path.string() + " records document id '" + out.job.meta.documentId +
                     "', using '" + id + "'");
            out.job.meta.documentId = id;
        }

        LOG_DEBUG("Loaded job " + id + " (" + std::to_string(out.job.segments.size()) + " segments)");
        return out;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load job " + id + ": " + std::string(e.what()));
        return failure(StoreError::IoError, e.what());
    }
}

SaveResult Store::save(const Job& job) const noexcept {
    try {
        if (!isValidDocumentId(job.meta.documentId)) {
            return {false, StoreError::InvalidArgument, "Invalid document id: '" + job.meta.documentId + "'"};
        }

        std::string error;
        if (!writeFileAtomic(pathFor(job.meta.documentId), serializeJob(job), error)) {
            LOG_ERROR("Failed to persist job " + job.meta.documentId + ": " + error);
            return {false, StoreError::IoError, error};
        }

        LOG_TRACE("Persisted job " + job.meta.documentId);
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist job " + job.meta.documentId + ": " + std::string(e.what()));
        return {false, StoreError::IoError, e.what()};
    }
}

bool Store::exists(const DocumentId& id) const noexcept {
    try {
        std::error_code ec;
        return isValidDocumentId(id) && std::filesystem::is_regular_file(pathFor(id), ec);
    } catch (const std::exception&) {
        return false;
    }
}

std::filesystem::path Store::pathFor(const DocumentId& id) const {
    return workspace_ / (id + kSuffix);
}

std::optional<Artifact> Store::resolveArtifact(const std::filesystem::path& file) {
    const std::string name = file.filename().string();
    const std::string suffix = kSuffix;
    if (name.size() <= suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }

    Artifact artifact;
    artifact.documentId = name.substr(0, name.size() - suffix.size());
    artifact.workspace = file.has_parent_path() ? file.parent_path() : std::filesystem::path(".");
    return artifact;
}

bool Store::isValidDocumentId(const DocumentId& id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos &&
           id.find('\0') == std::string::npos;
}

}
