/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/segmenter.hpp"
#include "tessera/logger.hpp"
#include <algorithm>
#include <array>
#include <cstdint>

namespace tessera {

namespace {

bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

// Byte offset of every code point start, plus a trailing sentinel at size().
std::vector<std::size_t> codepointOffsets(std::string_view text) {
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isContinuation(static_cast<unsigned char>(text[i])) || offsets.empty()) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

// Rightmost byte position of `c` in [from, to), or npos.
std::size_t rfindIn(std::string_view text, char c, std::size_t from, std::size_t to) noexcept {
    for (std::size_t i = to; i > from; --i) {
        if (text[i - 1] == c) {
            return i - 1;
        }
    }
    return std::string_view::npos;
}

constexpr std::array<char, 4> kBoundaries = {'\n', '.', ',', ' '};

}

std::vector<std::string> segment(std::string_view text, std::size_t budget) {
    std::vector<std::string> segments;
    if (text.empty() || budget == 0) {
        return segments;
    }

    const std::vector<std::size_t> offsets = codepointOffsets(text);
    const std::size_t length = offsets.size() - 1;
    const std::size_t window = budget / 2;

    std::size_t start = 0;
    while (start < length) {
        if (length - start <= budget) {
            segments.emplace_back(text.substr(offsets[start]));
            break;
        }

        const std::size_t ideal = start + budget;
        const std::size_t searchStart = std::max(start, ideal - window);
        std::size_t cut = ideal;

        // Boundary characters are ASCII, so a byte scan never lands inside
        // a multi-byte sequence and pos + 1 is always a code point start.
        for (char boundary : kBoundaries) {
            std::size_t pos = rfindIn(text, boundary, offsets[searchStart], offsets[ideal]);
            if (pos != std::string_view::npos) {
                auto it = std::lower_bound(offsets.begin(), offsets.end(), pos + 1);
                cut = static_cast<std::size_t>(it - offsets.begin());
                break;
            }
        }

        segments.emplace_back(text.substr(offsets[start], offsets[cut] - offsets[start]));
        start = cut;
    }

    LOG_DEBUG("Segmented " + std::to_string(length) + " code points into " +
              std::to_string(segments.size()) + " segments (budget " + std::to_string(budget) + ")");
    return segments;
}

bool isValidUtf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if (!isContinuation(cc)) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range values
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::size_t codepointLength(std::string_view text) noexcept {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isContinuation(static_cast<unsigned char>(text[i])) || i == 0) {
            ++count;
        }
    }
    return count;
}

std::string utf8Prefix(std::string_view text, std::size_t maxCodepoints) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isContinuation(static_cast<unsigned char>(text[i])) || i == 0) {
            if (seen == maxCodepoints) {
                return std::string(text.substr(0, i));
            }
            ++seen;
        }
    }
    return std::string(text);
}

}
