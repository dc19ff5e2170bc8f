/*
 * tessera - Output rebuild tool (tessera-rebuild)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/assembler.hpp"
#include "tessera/logger.hpp"
#include "tessera/store.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace tessera;

constexpr const char* VERSION = "0.1.0";


namespace {

std::string joinIndices(const std::vector<std::size_t>& indices) {
    std::ostringstream ss;
    ss << "[";
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << indices[i];
    }
    ss << "]";
    return ss.str();
}

}

void printUsage(const char* progName) {
    std::cout << "tessera Output Rebuild Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <document_id> [-o <output>]\n";
    std::cout << "       " << progName << " <file_chunked.json> [-o <output>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace       Directory holding the job file\n";
    std::cout << "  document_id     Job to rebuild\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output    Output file (default: <workspace>/<document_id>_final.txt)\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Exit status: 0 success (possibly partial), 1 job or file error,\n";
    std::cout << "             2 no completed segments to rebuild\n";
}

int main(int argc, char* argv[]) {
    Logger::init("tessera-rebuild", LogLevel::WARN);

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
    std::filesystem::path outputPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path\n";
                return kExitError;
            }
            outputPath = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return kExitError;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage(argv[0]);
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

    try {
        Store store(target.workspace);
        Assembler assembler(store);

        AssembleReport report = assembler.assemble(target.documentId);
        if (report.error == AssembleError::NotFound || report.error == AssembleError::InvalidJob ||
            report.error == AssembleError::IoError) {
            std::cerr << "Error: " << report.message << std::endl;
            return exitCodeFor(report.error);
        }

        std::cout << "Segment Statistics:\n";
        std::cout << "- Total segments: " << report.total << "\n";
        std::cout << "- Completed: " << report.done.size() << "\n";
        std::cout << "- Errors: " << report.errors.size() << "\n";
        std::cout << "- Pending: " << report.pending.size() << "\n";

        if (!report.errors.empty()) {
            std::cout << "\nWarning: Found " << report.errors.size() << " segments with errors: "
                      << joinIndices(report.errors) << "\n";
        }
        if (!report.pending.empty()) {
            std::cout << "\nWarning: Found " << report.pending.size() << " pending segments: "
                      << joinIndices(report.pending) << "\n";
        }

        if (report.error == AssembleError::NothingToRebuild) {
            std::cout << "\n" << report.message << std::endl;
            return exitCodeFor(report.error);
        }

        if (outputPath.empty()) {
            outputPath = assembler.defaultOutputPath(target.documentId);
        }

        std::string error;
        if (!assembler.write(report, outputPath, error)) {
            std::cerr << "Error: " << error << std::endl;
            return kExitError;
        }

        const std::size_t bytes = report.output.size();
        std::cout << "\nSuccessfully rebuilt " << report.done.size() << " segments\n";
        std::cout << "Output file: " << outputPath.string() << "\n";
        std::cout << "File size: " << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / 1024.0)
                  << " KB (" << bytes << " bytes)\n";

        if (!report.complete()) {
            std::cout << "\nNote: Output is incomplete. Missing " << report.missing() << " segments.\n";
        }
        std::cout << std::flush;
        return exitCodeFor(report.error);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}
