/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace tessera {

// Typed environment lookups. Unset, empty or unparsable values yield the default.
[[nodiscard]] int envInt(const char* name, int defv) noexcept;
[[nodiscard]] float envFloat(const char* name, float defv) noexcept;
// Zero is treated as unset.
[[nodiscard]] std::size_t envSize(const char* name, std::size_t defv) noexcept;
[[nodiscard]] std::string envString(const char* name, const std::string& defv = "");

// Whole-string non-negative decimal integer, as taken by numeric flags.
// Trailing characters, signs and out-of-range values yield nullopt.
[[nodiscard]] std::optional<std::size_t> parseCount(const std::string& text) noexcept;

}
