/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "nexrun/types.hpp"

namespace nexrun {

struct StageRequest {
    std::string stageBinary;
    std::string inputCase;
    std::string outputCase;
    std::string study;
    int workerCount = 1;
};

// [binary, input, -c, output, -s, study], prefixed with
// [launcher, -np, N] when more than one worker is requested.
[[nodiscard]] LaunchCommand composeCommand(const StageRequest& request, const std::string& launcher);

// Single shell-quoted line, for logs and dry runs.
[[nodiscard]] std::string formatCommand(const LaunchCommand& command);

}
