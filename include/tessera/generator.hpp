/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

namespace tessera {

struct RunResult {
    bool ok = false;
    std::string output;
    std::string error;
};

// A text-generation service. One call per segment; no retry is expected.
class Generator {
public:
    virtual ~Generator() = default;

    [[nodiscard]] virtual RunResult run(const std::string& prompt) = 0;
};

// Removes <think>...</think> reasoning blocks and leading whitespace.
[[nodiscard]] std::string stripThinkBlocks(const std::string& text);

}
