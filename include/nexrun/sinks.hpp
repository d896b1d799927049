/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace nexrun {

enum class SinkKind : uint8_t {
    Capture,    // collected in memory
    Descriptor  // written straight to a caller-owned file descriptor
};

struct OutputSink {
    SinkKind kind = SinkKind::Capture;
    int fd = -1;
    std::string captured;
    std::size_t limit = 0;  // capture keeps only the newest `limit` bytes; 0 keeps everything

    [[nodiscard]] static OutputSink capture(std::size_t limit = 0) { return {SinkKind::Capture, -1, {}, limit}; }
    [[nodiscard]] static OutputSink descriptor(int fd) { return {SinkKind::Descriptor, fd, {}, 0}; }
};

struct OutputSinks {
    OutputSink out;
    OutputSink err;
};

// Owns a truncated, write-only log file. Closed on destruction.
class LogFile final {
public:
    explicit LogFile(const std::filesystem::path& path) noexcept;
    ~LogFile();

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;
    LogFile(LogFile&& other) noexcept;
    LogFile& operator=(LogFile&& other) noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    // errno text of a failed open
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    void close() noexcept;

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::string error_;
};

}
