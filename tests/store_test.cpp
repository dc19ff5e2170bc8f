/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "harness.hpp"
#include "tessera/logger.hpp"
#include "tessera/store.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using namespace tessera;
using tessera::test::Suite;
using tessera::test::TempDir;

namespace {

void writeRaw(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string readRaw(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool sameSegment(const Segment& a, const Segment& b) {
    if (a.index != b.index || a.text != b.text || a.status() != b.status() || a.attempts != b.attempts) {
        return false;
    }
    if (a.result() && *a.result() != *b.result()) return false;
    if (a.errorDetail() && *a.errorDetail() != *b.errorDetail()) return false;
    return true;
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    Suite suite("store");

    suite.run("create writes pending segments", [] {
        TempDir dir;
        Store store(dir.path());
        LoadResult created = store.create("book", {"one ", "two ", "three"}, 5);
        CHECK(created);
        CHECK(store.exists("book"));
        CHECK(std::filesystem::exists(dir.path() / "book_chunked.json"));

        LoadResult loaded = store.load("book");
        CHECK(loaded);
        CHECK(loaded.job.meta.documentId == "book");
        CHECK(loaded.job.meta.chunkSize == 5);
        CHECK(loaded.job.meta.totalChunks == 3);
        CHECK(loaded.job.segments.size() == 3);
        for (std::size_t i = 0; i < 3; ++i) {
            CHECK(loaded.job.segments[i].index == i);
            CHECK(loaded.job.segments[i].status() == Status::Pending);
            CHECK(loaded.job.segments[i].attempts == 0);
        }
        CHECK(loaded.job.segments[2].text == "three");
    });

    suite.run("save and load round trip every state", [] {
        TempDir dir;
        Store store(dir.path());
        std::vector<std::string> texts = {
            "quotes \" and \\ backslashes\n", "tabs\tand\r\nCRLF", "unicode café 日本語 😀", "", "plain"};
        LoadResult created = store.create("mixed", texts, 30);
        CHECK(created);

        Job job = created.job;
        job.segments[0].state = Done{"result with \"quotes\"\nand lines"};
        job.segments[0].attempts = 1;
        job.segments[1].state = Error{"timeout: 504 Gateway"};
        job.segments[1].attempts = 2;
        job.segments[2].state = Done{"日本語 result"};
        job.segments[2].attempts = 3;
        CHECK(store.save(job));

        LoadResult loaded = store.load("mixed");
        CHECK(loaded);
        CHECK(loaded.job.segments.size() == job.segments.size());
        for (std::size_t i = 0; i < job.segments.size(); ++i) {
            CHECK(sameSegment(loaded.job.segments[i], job.segments[i]));
        }
    });

    suite.run("persisted record uses the documented layout", [] {
        TempDir dir;
        Store store(dir.path());
        LoadResult created = store.create("layout", {"a", "b"}, 1);
        CHECK(created);
        Job job = created.job;
        job.segments[1].state = Error{"boom"};
        CHECK(store.save(job));

        auto root = nlohmann::json::parse(readRaw(store.pathFor("layout")));
        CHECK(root["meta"]["document_id"] == "layout");
        CHECK(root["meta"]["chunk_size"] == 1);
        CHECK(root["meta"]["total_chunks"] == 2);
        CHECK(root["chunks"][0]["status"] == "pending");
        CHECK(root["chunks"][0]["result"].is_null());
        CHECK(root["chunks"][0]["error_detail"].is_null());
        CHECK(root["chunks"][1]["status"] == "error");
        CHECK(root["chunks"][1]["error_detail"] == "boom");
        CHECK(root["chunks"][1]["result"].is_null());
    });

    suite.run("missing job is NotFound", [] {
        TempDir dir;
        Store store(dir.path());
        LoadResult loaded = store.load("nothing");
        CHECK(!loaded);
        CHECK(loaded.error == StoreError::NotFound);
        CHECK(!store.exists("nothing"));
    });

    suite.run("malformed files are rejected", [] {
        TempDir dir;
        Store store(dir.path());
        const std::vector<std::string> bad = {
            "not json at all",
            "[]",
            R"({"meta":{"document_id":"m","chunk_size":5,"total_chunks":0}})",
            R"({"meta":{"document_id":"m","chunk_size":5,"total_chunks":2},"chunks":[{"index":0,"text":"a","status":"pending"}]})",
            R"({"meta":{"document_id":"m","chunk_size":5,"total_chunks":1},"chunks":[{"index":1,"text":"a","status":"pending"}]})",
            R"({"meta":{"document_id":"m","chunk_size":5,"total_chunks":1},"chunks":[{"index":0,"text":"a","status":"finished"}]})",
            R"({"meta":{"document_id":"m","chunk_size":-5,"total_chunks":1},"chunks":[{"index":0,"text":"a","status":"pending"}]})",
            R"({"meta":{"document_id":"m","chunk_size":5,"total_chunks":1},"chunks":[{"index":0,"status":"pending"}]})",
        };
        for (const auto& content : bad) {
            writeRaw(store.pathFor("m"), content);
            LoadResult loaded = store.load("m");
            CHECK(!loaded);
            CHECK(loaded.error == StoreError::Malformed);
        }
    });

    suite.run("legacy artifacts with book_id load", [] {
        TempDir dir;
        Store store(dir.path());
        writeRaw(store.pathFor("legacy"), R"({
          "meta": {"book_id": "legacy", "chunk_size": 4, "total_chunks": 3},
          "chunks": [
            {"index": 0, "text": "ab", "status": "done", "result": null},
            {"index": 1, "text": "cd", "status": "error", "result": null, "error": "rate limited"},
            {"index": 2, "text": "ef", "status": "done", "result": "EF"}
          ]})");
        LoadResult loaded = store.load("legacy");
        CHECK(loaded);
        CHECK(loaded.job.meta.documentId == "legacy");
        CHECK(loaded.job.segments[0].status() == Status::Pending);
        CHECK(loaded.job.segments[1].status() == Status::Error);
        CHECK(*loaded.job.segments[1].errorDetail() == "rate limited");
        CHECK(loaded.job.segments[1].attempts == 0);
        CHECK(*loaded.job.segments[2].result() == "EF");
    });

    suite.run("file name wins over the recorded document id", [] {
        TempDir dir;
        Store store(dir.path());
        CHECK(store.create("orig", {"ab", "cd"}, 2));
        std::filesystem::rename(store.pathFor("orig"), store.pathFor("renamed"));

        LoadResult loaded = store.load("renamed");
        CHECK(loaded);
        CHECK(loaded.job.meta.documentId == "renamed");

        loaded.job.segments[0].state = Done{"AB"};
        CHECK(store.save(loaded.job));
        CHECK(!std::filesystem::exists(store.pathFor("orig")));
        CHECK(*store.load("renamed").job.segments[0].result() == "AB");
    });

    suite.run("error without detail gets a placeholder", [] {
        LoadResult parsed = parseJob(
            R"({"meta":{"document_id":"e","chunk_size":2,"total_chunks":1},"chunks":[{"index":0,"text":"a","status":"error"}]})");
        CHECK(parsed);
        CHECK(*parsed.job.segments[0].errorDetail() == "unknown error");
    });

    suite.run("create overwrites unless told not to", [] {
        TempDir dir;
        Store store(dir.path());
        CHECK(store.create("doc", {"first"}, 10));

        LoadResult refused = store.create("doc", {"second"}, 10, CreateMode::FailIfExists);
        CHECK(!refused);
        CHECK(refused.error == StoreError::AlreadyExists);
        CHECK(store.load("doc").job.segments[0].text == "first");

        CHECK(store.create("doc", {"second", "third"}, 10));
        LoadResult loaded = store.load("doc");
        CHECK(loaded.job.segments.size() == 2);
        CHECK(loaded.job.segments[0].text == "second");
    });

    suite.run("invalid arguments are rejected", [] {
        TempDir dir;
        Store store(dir.path());
        CHECK(store.create("", {"a"}, 10).error == StoreError::InvalidArgument);
        CHECK(store.create("a/b", {"a"}, 10).error == StoreError::InvalidArgument);
        CHECK(store.create("..", {"a"}, 10).error == StoreError::InvalidArgument);
        CHECK(store.create("ok", {"a"}, 0).error == StoreError::InvalidArgument);
        CHECK(store.load("../x").error == StoreError::InvalidArgument);
    });

    suite.run("create makes the workspace directory", [] {
        TempDir dir;
        Store store(dir.path() / "nested" / "jobs");
        CHECK(store.create("doc", {"a"}, 1));
        CHECK(store.exists("doc"));
    });

    suite.run("save leaves no temp file behind", [] {
        TempDir dir;
        Store store(dir.path());
        LoadResult created = store.create("clean", {"a", "b"}, 1);
        CHECK(created);
        CHECK(store.save(created.job));
        auto tmp = store.pathFor("clean");
        tmp += ".tmp";
        CHECK(!std::filesystem::exists(tmp));
    });

    suite.run("save fails when the workspace is gone", [] {
        TempDir dir;
        Store store(dir.path() / "ws");
        LoadResult created = store.create("gone", {"a"}, 1);
        CHECK(created);
        std::filesystem::remove_all(dir.path() / "ws");
        SaveResult saved = store.save(created.job);
        CHECK(!saved);
        CHECK(saved.error == StoreError::IoError);
    });

    suite.run("artifact paths resolve to workspace and id", [] {
        auto nested = Store::resolveArtifact("jobs/novel_chunked.json");
        CHECK(nested);
        CHECK(nested->workspace == std::filesystem::path("jobs"));
        CHECK(nested->documentId == "novel");

        auto bare = Store::resolveArtifact("novel_chunked.json");
        CHECK(bare);
        CHECK(bare->workspace == std::filesystem::path("."));

        CHECK(!Store::resolveArtifact("novel.json"));
        CHECK(!Store::resolveArtifact("_chunked.json"));
    });

    return suite.finish();
}
