/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/env.hpp"
#include "tessera/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace tessera {

int envInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-integer ") + name + "=" + val);
        return defv;
    }
}

float envFloat(const char* name, float defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stof(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
        return defv;
    }
}

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid size ") + name + "=" + val);
        return defv;
    }
}

std::optional<std::size_t> parseCount(const std::string& text) noexcept {
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

}
