/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tessera {

// Split text into ordered segments of at most `budget` code points.
//
// For each cut the trailing half of the budget window is searched from the
// right for a newline, then a period, then a comma, then a space; the cut
// lands just after the first class found. With no boundary in the window the
// cut is made exactly at the budget. Concatenating the result reproduces
// `text` byte for byte.
//
// Precondition: budget >= 1. Text must be valid UTF-8 for code point
// counting to be meaningful; a stray continuation byte is counted with the
// code point before it, or as one code point at the start of the text.
[[nodiscard]] std::vector<std::string> segment(std::string_view text, std::size_t budget);

[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;
[[nodiscard]] std::size_t codepointLength(std::string_view text) noexcept;

// First `maxCodepoints` code points of text, never splitting a sequence.
[[nodiscard]] std::string utf8Prefix(std::string_view text, std::size_t maxCodepoints);

}
