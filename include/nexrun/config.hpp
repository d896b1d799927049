/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "nexrun/types.hpp"

namespace nexrun {

inline constexpr const char* kStandExeVar = "STAND_EXE";
inline constexpr const char* kNexusExeVar = "NEXUS_EXE";
inline constexpr const char* kLauncherVar = "NEXRUN_MPIEXEC";
inline constexpr const char* kDefaultLauncher = "mpiexec";

enum class ConfigError : uint8_t {
    None = 0,
    MissingVariable
};

// Locations of the external tools a run invokes.
struct ToolConfig {
    std::string standExe;
    std::string nexusExe;
    std::string launcher = kDefaultLauncher;

    [[nodiscard]] const std::string& binaryFor(Stage stage) const noexcept {
        return stage == Stage::Init ? standExe : nexusExe;
    }
};

struct ConfigResult {
    bool ok = false;
    ToolConfig config;
    ConfigError error = ConfigError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Returns the value of a variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] std::optional<std::string> processEnv(const std::string& name);

// Resolves both stage binaries and the launcher. Every missing required
// variable is named in the message, not only the first.
[[nodiscard]] ConfigResult loadToolConfig(const EnvLookup& lookup = processEnv);

}
