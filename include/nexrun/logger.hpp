/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace nexrun {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    // Tag printed on every line, e.g. the stage being run. Empty prints no tag.
    static void setContext(const std::string& context);
    [[nodiscard]] static std::string context();

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses "error", "warn", "info", "debug", "trace" (case-insensitive).
    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;
};

// Sets the log context for a scope and restores the previous one after.
class ScopedLogContext final {
public:
    explicit ScopedLogContext(const std::string& context);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

}

#define LOG_ERROR(msg) ::nexrun::Logger::error(msg)
#define LOG_WARN(msg)  ::nexrun::Logger::warn(msg)
#define LOG_INFO(msg)  ::nexrun::Logger::info(msg)
#define LOG_DEBUG(msg) ::nexrun::Logger::debug(msg)
#define LOG_TRACE(msg) ::nexrun::Logger::trace(msg)
