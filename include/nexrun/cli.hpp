/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "nexrun/config.hpp"

namespace nexrun {

inline constexpr const char* kVersion = "0.1.0";

void printUsage(const std::string& progName, std::ostream& os);

// One driver invocation. args excludes the program name; the environment is
// only consulted once the arguments describe a run. Returns the exit code.
[[nodiscard]] int runCli(const std::string& progName, const std::vector<std::string>& args,
                         const EnvLookup& env, std::ostream& out, std::ostream& err);

// SIGINT, SIGTERM and SIGHUP end the run: the in-flight stage fails as
// Signaled and no later stage starts.
[[nodiscard]] bool installSignalHandlers() noexcept;

}
