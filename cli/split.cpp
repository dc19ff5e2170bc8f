/*
 * tessera - Document split tool (tessera-split)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/env.hpp"
#include "tessera/logger.hpp"
#include "tessera/segmenter.hpp"
#include "tessera/store.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace tessera;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "tessera Document Split Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <input_file> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input_file        UTF-8 text document to split\n\n";
    std::cout << "Options:\n";
    std::cout << "  --chunk-size <n>  Maximum segment length in characters (default: 2000)\n";
    std::cout << "  --workspace <dir> Directory for the job file (default: .)\n";
    std::cout << "  --id <id>         Document id (default: input file name without extension)\n";
    std::cout << "  --no-clobber      Fail instead of replacing an existing job\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TESSERA_CHUNK_SIZE   Default chunk size\n";
    std::cout << "  TESSERA_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " book.txt\n";
    std::cout << "  " << progName << " book.txt --chunk-size 4000 --workspace ./jobs\n";
}

int main(int argc, char* argv[]) {
    Logger::init("tessera-split", LogLevel::WARN);

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

    std::filesystem::path input;
    std::filesystem::path workspace = ".";
    std::string chunkSizeArg;
    DocumentId documentId;
    CreateMode mode = CreateMode::Overwrite;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--chunk-size" || arg == "--workspace" || arg == "--id") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return kExitError;
            }
            std::string value = argv[++i];
            if (arg == "--chunk-size") chunkSizeArg = value;
            else if (arg == "--workspace") workspace = value;
            else documentId = value;
        } else if (arg == "--no-clobber") {
            mode = CreateMode::FailIfExists;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return kExitError;
        } else if (input.empty()) {
            input = arg;
        } else {
            std::cerr << "Error: Unexpected argument " << arg << "\n";
            return kExitError;
        }
    }

    if (input.empty()) {
        printUsage(argv[0]);
        return kExitError;
    }

    std::size_t chunkSize = envSize("TESSERA_CHUNK_SIZE", 2000);
    if (!chunkSizeArg.empty()) {
        auto parsed = parseCount(chunkSizeArg);
        if (!parsed || *parsed < 1) {
            std::cerr << "Error: --chunk-size must be a positive integer\n";
            return kExitError;
        }
        chunkSize = *parsed;
    }

    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(input, ec)) {
            std::cerr << "Error: Input file '" << input.string() << "' not found\n";
            return kExitError;
        }

        std::ifstream file(input, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot read '" << input.string() << "'\n";
            return kExitError;
        }
        std::string text((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());

        if (!isValidUtf8(text)) {
            std::cerr << "Error: '" << input.string() << "' is not valid UTF-8\n";
            return kExitError;
        }

        if (documentId.empty()) {
            documentId = input.stem().string();
        }

        Store store(workspace);
        LoadResult created = store.create(documentId, segment(text, chunkSize), chunkSize, mode);
        if (!created) {
            std::cerr << "Error: " << created.message << std::endl;
            return kExitError;
        }

        std::cout << "Created " << store.pathFor(documentId).string() << "\n";
        std::cout << "Document id: " << documentId << "\n";
        std::cout << "Total segments: " << created.job.segments.size() << "\n";
        std::cout << "Chunk size: " << chunkSize << " characters" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}
