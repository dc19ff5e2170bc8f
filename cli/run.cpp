/*
 * tessera - Segment processing tool (tessera-run)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/env.hpp"
#include "tessera/logger.hpp"
#include "tessera/processor.hpp"
#include "tessera/runner.hpp"
#include "tessera/segmenter.hpp"
#include "tessera/store.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tessera;

constexpr const char* VERSION = "0.1.0";


namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", std::localtime(&time));
    return buf;
}

std::string oneLine(std::string text) {
    for (char& c : text) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return text;
}

}

void printUsage(const char* progName) {
    std::cout << "tessera Segment Processing Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <document_id> --prompt <template> [options]\n";
    std::cout << "       " << progName << " <file_chunked.json> --prompt <template> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace           Directory holding the job file\n";
    std::cout << "  document_id         Job to advance\n\n";
    std::cout << "Options:\n";
    std::cout << "  --prompt <text>     Prompt template; {text} is replaced by each segment\n";
    std::cout << "  --model <path>      GGUF model file\n";
    std::cout << "  --max-attempts <n>  Stop retrying a failed segment after n attempts (0 = never stop)\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TESSERA_MODEL          Model path (takes precedence over --model)\n";
    std::cout << "  TESSERA_MAX_ATTEMPTS   Default attempt limit (3)\n";
    std::cout << "  TESSERA_TEMP           Sampling temperature (0.3)\n";
    std::cout << "  TESSERA_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Exit status: 0 success, 1 job or configuration error, 2 nothing to do,\n";
    std::cout << "             3 job file could not be saved\n";
}

int main(int argc, char* argv[]) {
    Logger::init("tessera-run", LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    std::vector<std::string> positional;
    std::string promptTemplate;
    std::string modelPath;
    bool havePrompt = false;
    int maxAttempts = envInt("TESSERA_MAX_ATTEMPTS", 3);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--prompt" || arg == "--model" || arg == "--max-attempts") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return kExitError;
            }
            std::string value = argv[++i];
            if (arg == "--prompt") {
                promptTemplate = value;
                havePrompt = true;
            } else if (arg == "--model") {
                modelPath = value;
            } else {
                auto parsed = parseCount(value);
                maxAttempts = parsed && *parsed <= 1000000 ? static_cast<int>(*parsed) : -1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return kExitError;
        } else {
            positional.push_back(arg);
        }
    }

    if (!havePrompt || positional.empty() || positional.size() > 2) {
        printUsage(argv[0]);
        return kExitError;
    }
    if (maxAttempts < 0) {
        std::cerr << "Error: --max-attempts must be a non-negative integer\n";
        return kExitError;
    }

    Artifact target;
    if (positional.size() == 2) {
        target = {positional[0], positional[1]};
    } else {
        auto artifact = Store::resolveArtifact(positional[0]);
        if (!artifact) {
            std::cerr << "Error: '" << positional[0] << "' is not a *" << Store::kSuffix << " job file\n";
            return kExitError;
        }
        target = *artifact;
    }

    modelPath = envString("TESSERA_MODEL", modelPath);

    try {
        Store store(target.workspace);
        RunOptions options{promptTemplate, static_cast<std::uint32_t>(maxAttempts)};

        // Inspect the job before paying for a model load
        LoadResult loaded = store.load(target.documentId);
        if (!loaded) {
            std::cerr << "Error: " << loaded.message << std::endl;
            return kExitError;
        }
        ScanResult work = Processor::scan(loaded.job, options.maxAttempts);

        std::cout << "Starting processing of " << store.pathFor(target.documentId).string() << "\n";
        std::cout << "Found " << loaded.job.segments.size() << " segments: " << work.pending.size()
                  << " pending, " << work.done << " already done";
        if (!work.exhausted.empty()) {
            std::cout << ", " << work.exhausted.size() << " over the attempt limit";
        }
        std::cout << "\n" << std::endl;

        if (work.pending.empty()) {
            std::cout << "All segments already processed." << std::endl;
            return exitCodeFor(ProcessResult::Idle);
        }

        if (modelPath.empty()) {
            std::cerr << "Error: No model given (use --model or TESSERA_MODEL)\n";
            return kExitError;
        }

        std::unique_ptr<Runner> runner;
        try {
            runner = std::make_unique<Runner>(modelPath, RunnerConfig::fromEnv());
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return kExitError;
        }

        Processor processor(store, *runner);
        auto segmentStart = std::chrono::steady_clock::now();
        processor.setObserver([&segmentStart](const Segment& seg, const Progress& progress, SegmentEvent event) {
            if (event == SegmentEvent::Started) {
                segmentStart = std::chrono::steady_clock::now();
                std::string preview = utf8Prefix(seg.text, 50);
                if (preview.size() < seg.text.size()) preview += "...";
                std::cout << "    \033[90m" << timestamp() << "\033[0m  segment " << seg.index
                          << "  \033[33mrunning\033[0m  \"" << oneLine(preview) << "\"\n" << std::flush;
                return;
            }

            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration<double>(now - segmentStart).count();
            if (seg.isDone()) {
                std::cout << "    \033[90m" << timestamp() << "\033[0m  segment " << seg.index
                          << "  \033[32mdone\033[0m  " << std::fixed << std::setprecision(1) << elapsed << "s\n";
            } else {
                std::cout << "    \033[90m" << timestamp() << "\033[0m  segment " << seg.index
                          << "  \033[31mfailed\033[0m  " << std::fixed << std::setprecision(1) << elapsed << "s  "
                          << oneLine(seg.errorDetail() ? *seg.errorDetail() : std::string()) << "\n";
            }
            std::cout << progress.statusLine(now) << "\n" << std::flush;
        });

        ProcessReport report = processor.process(target.documentId, options);
        std::cout << "\n";

        switch (report.result) {
            case ProcessResult::Completed:
                std::cout << formatSummary(report.summary) << std::endl;
                break;
            case ProcessResult::Idle:
                std::cout << "All segments already processed." << std::endl;
                break;
            case ProcessResult::SystemError:
                std::cout << formatSummary(report.summary) << std::endl;
                std::cerr << "Error: " << report.message << std::endl;
                break;
            default:
                std::cerr << "Error: " << report.message << std::endl;
                break;
        }
        return exitCodeFor(report.result);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}
