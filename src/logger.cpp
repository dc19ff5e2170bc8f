/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tessera {

namespace {

constexpr const char* kLevelEnv = "TESSERA_LOG_LEVEL";

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
std::string g_program;

}

void Logger::init(std::string_view program, LogLevel fallback) noexcept {
    LogLevel chosen = fallback;
    bool unknown = false;
    const char* env_val = std::getenv(kLevelEnv);
    if (env_val && *env_val) {
        if (auto parsed = parseLevel(env_val)) {
            chosen = *parsed;
        } else {
            unknown = true;
        }
    }

    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        try {
            g_program.assign(program.data(), program.size());
        } catch (const std::exception&) {
            g_program.clear();
        }
        g_level = chosen;
    }

    if (unknown) {
        warn(std::string("Unknown ") + kLevelEnv + "=" + env_val + ", using " + levelName(chosen));
    }
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

std::string Logger::formatLine(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream ss;
    ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
       << " [" << std::left << std::setfill(' ') << std::setw(5) << levelName(level) << "]";
    if (!g_program.empty()) {
        ss << " " << g_program << ":";
    }
    ss << " " << message;
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    try {
        std::cerr << formatLine(level, message) << std::endl;
    } catch (const std::exception&) {
        std::fputs(message.c_str(), stderr);
        std::fputc('\n', stderr);
    }
}

std::optional<LogLevel> Logger::parseLevel(std::string_view text) noexcept {
    std::string lowered;
    try {
        lowered.reserve(text.size());
        for (char c : text) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

const char* Logger::levelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

}
