/*
 * nexrun - Two-stage simulation driver (nexrun)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/cli.hpp"
#include "nexrun/config.hpp"
#include "nexrun/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace nexrun;

int main(int argc, char* argv[]) {
    // Quiet by default so success stays silent; NEXRUN_LOG_LEVEL overrides
    if (!std::getenv("NEXRUN_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    if (!installSignalHandlers()) {
        LOG_WARN("Driver signals will not stop a running stage");
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    return runCli(argv[0], args, processEnv, std::cout, std::cerr);
}
