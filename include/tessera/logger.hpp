/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessera {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide leveled logger. Every line goes to stderr so stdout stays free
// for progress lines and command results.
class Logger {
public:
    // Tags each line with the program name and takes the level from
    // TESSERA_LOG_LEVEL, or `fallback` when it is unset or unrecognised.
    static void init(std::string_view program, LogLevel fallback) noexcept;

    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Case-insensitive; accepts "warning" for WARN.
    [[nodiscard]] static std::optional<LogLevel> parseLevel(std::string_view text) noexcept;
    [[nodiscard]] static const char* levelName(LogLevel level) noexcept;

private:
    static std::string formatLine(LogLevel level, const std::string& message);
};

}

#define LOG_ERROR(msg) ::tessera::Logger::error(msg)
#define LOG_WARN(msg)  ::tessera::Logger::warn(msg)
#define LOG_INFO(msg)  ::tessera::Logger::info(msg)
#define LOG_DEBUG(msg) ::tessera::Logger::debug(msg)
#define LOG_TRACE(msg) ::tessera::Logger::trace(msg)
