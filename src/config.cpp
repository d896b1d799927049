/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/config.hpp"
#include "nexrun/logger.hpp"
#include <cstdlib>
#include <vector>

namespace nexrun {

std::optional<std::string> processEnv(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (!val) {
        return std::nullopt;
    }
    return std::string(val);
}

ConfigResult loadToolConfig(const EnvLookup& lookup) {
    ConfigResult result;
    std::vector<std::string> missing;

    auto required = [&](const char* name, std::string& out) {
        auto value = lookup(name);
        if (!value || value->empty()) {
            missing.emplace_back(name);
            return;
        }
        out = *value;
    };

    required(kStandExeVar, result.config.standExe);
    required(kNexusExeVar, result.config.nexusExe);

    if (auto launcher = lookup(kLauncherVar); launcher && !launcher->empty()) {
        result.config.launcher = *launcher;
    }

    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        result.error = ConfigError::MissingVariable;
        result.message = "missing environment variable(s): " + names;
        LOG_DEBUG("Tool configuration incomplete: " + names);
        return result;
    }

    LOG_DEBUG("Init binary: " + result.config.standExe);
    LOG_DEBUG("Exec binary: " + result.config.nexusExe);
    LOG_DEBUG("Parallel launcher: " + result.config.launcher);
    result.ok = true;
    return result;
}

}
