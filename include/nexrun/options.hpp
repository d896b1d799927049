/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "nexrun/orchestrator.hpp"

namespace nexrun {

enum class ParseError : uint8_t {
    None = 0,
    MissingInputCase,
    MissingValue,
    InvalidWorkerCount,
    ConflictingModes,
    UnknownOption,
    UnexpectedArgument
};

enum class ParseAction : uint8_t { Run, ShowHelp, ShowVersion };

struct ParseResult {
    bool ok = false;
    ParseAction action = ParseAction::Run;
    RunOptions options;
    ParseError error = ParseError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// args excludes the program name.
[[nodiscard]] ParseResult parseArguments(const std::vector<std::string>& args);

}
