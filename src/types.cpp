/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/types.hpp"

namespace tessera {

const char* statusToString(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Done: return "done";
        case Status::Error: return "error";
        default: return "unknown";
    }
}

std::optional<Status> parseStatus(std::string_view value) noexcept {
    if (value == "pending") return Status::Pending;
    if (value == "done") return Status::Done;
    if (value == "error") return Status::Error;
    return std::nullopt;
}

}
