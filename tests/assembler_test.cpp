/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "harness.hpp"
#include "tessera/assembler.hpp"
#include "tessera/logger.hpp"
#include "tessera/store.hpp"
#include <fstream>
#include <iterator>

using namespace tessera;
using tessera::test::Suite;
using tessera::test::TempDir;

namespace {

Job makeJob(const std::vector<SegmentState>& states) {
    Job job;
    job.meta.documentId = "book";
    job.meta.chunkSize = 4;
    job.meta.totalChunks = states.size();
    for (std::size_t i = 0; i < states.size(); ++i) {
        Segment seg;
        seg.index = i;
        seg.text = "src" + std::to_string(i);
        seg.state = states[i];
        job.segments.push_back(seg);
    }
    return job;
}

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    Suite suite("assembler");

    suite.run("done results are joined in order with no separator", [] {
        AssembleReport report = assemble(makeJob({Done{"A"}, Error{"boom"}, Done{"B"}}));
        CHECK(report);
        CHECK(report.output == "AB");
        CHECK(report.total == 3);
        CHECK(report.done == (std::vector<std::size_t>{0, 2}));
        CHECK(report.errors == std::vector<std::size_t>{1});
        CHECK(report.pending.empty());
        CHECK(report.missing() == 1);
        CHECK(!report.complete());
    });

    suite.run("complete job reproduces every result", [] {
        AssembleReport report = assemble(makeJob({Done{"Hello "}, Done{"world."}, Done{" Foo bar,"}}));
        CHECK(report.complete());
        CHECK(report.output == "Hello world. Foo bar,");
    });

    suite.run("pending segments are reported separately", [] {
        AssembleReport report = assemble(makeJob({Pending{}, Done{"x"}, Pending{}, Error{"e"}}));
        CHECK(report);
        CHECK(report.output == "x");
        CHECK(report.pending == (std::vector<std::size_t>{0, 2}));
        CHECK(report.errors == std::vector<std::size_t>{3});
        CHECK(report.missing() == 3);
    });

    suite.run("no done segment means nothing to rebuild", [] {
        AssembleReport none = assemble(makeJob({Pending{}, Error{"e"}}));
        CHECK(!none);
        CHECK(none.error == AssembleError::NothingToRebuild);
        CHECK(none.message == "No completed segments found. Nothing to rebuild.");
        CHECK(none.output.empty());

        AssembleReport empty = assemble(makeJob({}));
        CHECK(!empty);
        CHECK(empty.error == AssembleError::NothingToRebuild);
    });

    suite.run("assembler loads jobs from the store", [] {
        TempDir dir;
        Store store(dir.path());
        Assembler assembler(store);

        AssembleReport missing = assembler.assemble("nope");
        CHECK(!missing);
        CHECK(missing.error == AssembleError::NotFound);

        {
            std::ofstream out(store.pathFor("junk"), std::ios::binary);
            out << "[1, 2, 3]";
        }
        CHECK(assembler.assemble("junk").error == AssembleError::InvalidJob);

        LoadResult created = store.create("book", {"one", "two"}, 3);
        CHECK(created);
        created.job.segments[1].state = Done{"TWO"};
        CHECK(store.save(created.job));

        AssembleReport report = assembler.assemble("book");
        CHECK(report);
        CHECK(report.output == "TWO");
        CHECK(report.pending == std::vector<std::size_t>{0});
    });

    suite.run("rebuild is written to the default path", [] {
        TempDir dir;
        Store store(dir.path());
        Assembler assembler(store);

        LoadResult created = store.create("book", {"a", "b"}, 1);
        CHECK(created);
        created.job.segments[0].state = Done{"first\n"};
        created.job.segments[1].state = Done{"second\n"};
        CHECK(store.save(created.job));

        const auto target = assembler.defaultOutputPath("book");
        CHECK(target == dir.path() / "book_final.txt");

        AssembleReport report = assembler.assemble("book");
        std::string error;
        CHECK(assembler.write(report, target, error));
        CHECK(error.empty());
        CHECK(slurp(target) == "first\nsecond\n");

        // Rebuilding again replaces the file rather than appending.
        CHECK(assembler.write(report, target, error));
        CHECK(slurp(target) == "first\nsecond\n");
    });

    suite.run("empty rebuild is never written", [] {
        TempDir dir;
        Store store(dir.path());
        Assembler assembler(store);
        CHECK(store.create("book", {"a"}, 1));

        AssembleReport report = assembler.assemble("book");
        CHECK(report.error == AssembleError::NothingToRebuild);

        std::string error;
        const auto target = assembler.defaultOutputPath("book");
        CHECK(!assembler.write(report, target, error));
        CHECK(!error.empty());
        CHECK(!std::filesystem::exists(target));
    });

    suite.run("rebuild outcomes map to distinct exit codes", [] {
        CHECK(exitCodeFor(AssembleError::None) == 0);
        CHECK(exitCodeFor(AssembleError::NotFound) == 1);
        CHECK(exitCodeFor(AssembleError::InvalidJob) == 1);
        CHECK(exitCodeFor(AssembleError::IoError) == 1);
        CHECK(exitCodeFor(AssembleError::NothingToRebuild) == 2);

        TempDir dir;
        Store store(dir.path());
        Assembler assembler(store);
        CHECK(exitCodeFor(assembler.assemble("absent").error) == kExitError);

        LoadResult created = store.create("book", {"a", "b"}, 1);
        CHECK(created);
        CHECK(exitCodeFor(assembler.assemble("book").error) == kExitNothingToDo);

        created.job.segments[0].state = Done{"A"};
        CHECK(store.save(created.job));
        CHECK(exitCodeFor(assembler.assemble("book").error) == kExitOk);
    });

    return suite.finish();
}
