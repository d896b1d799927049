/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/logger.hpp"
#include <iostream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>

namespace nexrun {

static LogLevel g_level = LogLevel::INFO;
static bool g_level_initialized = false;
static std::string g_context;
static std::mutex g_log_mutex;

namespace {
LogLevel envLevel() noexcept {
    const char* env_val = std::getenv("NEXRUN_LOG_LEVEL");
    return env_val ? Logger::parseLevel(env_val, LogLevel::INFO) : LogLevel::INFO;
}

const char* levelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = envLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::setContext(const std::string& context) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_context = context;
}

std::string Logger::context() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_context;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        line << " [" << levelTag(level) << "]";

        // stdout belongs to the user-facing output, diagnostics go to stderr
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (!g_context.empty()) {
            line << " [" << g_context << "]";
        }
        line << " " << message;
        std::cerr << line.str() << std::endl;
    } catch (...) {
        // Logging must never throw into the caller
    }
}

LogLevel Logger::parseLevel(const std::string& text, LogLevel fallback) noexcept {
    std::string level_str(text);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return fallback;
}

ScopedLogContext::ScopedLogContext(const std::string& context) : previous_(Logger::context()) {
    Logger::setContext(context);
}

ScopedLogContext::~ScopedLogContext() {
    try {
        Logger::setContext(previous_);
    } catch (const std::exception&) {
        // The previous tag is lost; log lines stay correct otherwise
    }
}

}
