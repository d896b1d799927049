/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/sinks.hpp"
#include "nexrun/logger.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace nexrun {

LogFile::LogFile(const std::filesystem::path& path) noexcept : path_(path) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error_ = std::strerror(errno);
        LOG_ERROR("Failed to open log file " + path_.string() + ": " + error_);
        return;
    }
    LOG_DEBUG("Opened log file: " + path_.string());
}

LogFile::~LogFile() {
    close();
}

LogFile::LogFile(LogFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), error_(std::move(other.error_)) {
    other.fd_ = -1;
}

LogFile& LogFile::operator=(LogFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        error_ = std::move(other.error_);
        other.fd_ = -1;
    }
    return *this;
}

void LogFile::close() noexcept {
    if (fd_ < 0) {
        return;
    }
    if (::close(fd_) != 0) {
        LOG_WARN("Error closing log file " + path_.string() + ": " + std::strerror(errno));
    }
    fd_ = -1;
    LOG_DEBUG("Closed log file: " + path_.string());
}

}
