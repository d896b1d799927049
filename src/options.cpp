/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/options.hpp"
#include "nexrun/logger.hpp"
#include <optional>

namespace nexrun {

namespace {
ParseResult failure(ParseError error, const std::string& message) {
    ParseResult result;
    result.error = error;
    result.message = message;
    LOG_DEBUG("Argument error: " + message);
    return result;
}

std::optional<int> parseWorkerCount(const std::string& text) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < 1) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Splits "--name=value" into name and value.
void splitInlineValue(const std::string& arg, std::string& name, std::optional<std::string>& value) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
        name = arg;
        return;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
}
}

ParseResult parseArguments(const std::vector<std::string>& args) {
    ParseResult result;
    RunOptions& options = result.options;
    bool haveInput = false;
    bool initOnly = false;
    bool execOnly = false;
    bool positionalOnly = false;

    auto takePositional = [&](const std::string& arg) -> bool {
        if (haveInput) {
            return false;
        }
        options.inputCase = arg;
        haveInput = true;
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (positionalOnly || arg.size() < 2 || arg[0] != '-') {
            if (!takePositional(arg)) {
                return failure(ParseError::UnexpectedArgument, "unexpected argument '" + arg + "'");
            }
            continue;
        }
        if (arg == "--") {
            positionalOnly = true;
            continue;
        }

        std::string name;
        std::optional<std::string> value;
        splitInlineValue(arg, name, value);

        // Short options take attached values too: -n4, -ocaseB
        if (!value && name.size() > 2 && name[1] != '-') {
            char flag = name[1];
            if (flag == 'o' || flag == 's' || flag == 'n') {
                value = name.substr(2);
                name = name.substr(0, 2);
            }
        }

        auto needValue = [&]() -> std::optional<std::string> {
            if (value) {
                return value;
            }
            if (i + 1 >= args.size()) {
                return std::nullopt;
            }
            return args[++i];
        };

        if (name == "-h" || name == "--help") {
            result.ok = true;
            result.action = ParseAction::ShowHelp;
            return result;
        }
        if (name == "-v" || name == "--version") {
            result.ok = true;
            result.action = ParseAction::ShowVersion;
            return result;
        }

        if (name == "-o" || name == "--output-case") {
            auto v = needValue();
            if (!v) return failure(ParseError::MissingValue, name + " requires a case name");
            options.outputCase = *v;
        } else if (name == "-s" || name == "--study") {
            auto v = needValue();
            if (!v) return failure(ParseError::MissingValue, name + " requires a study name");
            options.study = *v;
        } else if (name == "-n" || name == "--num-cpus") {
            auto v = needValue();
            if (!v) return failure(ParseError::MissingValue, name + " requires a process count");
            auto count = parseWorkerCount(*v);
            if (!count) {
                return failure(ParseError::InvalidWorkerCount,
                               "invalid process count '" + *v + "' (expected an integer >= 1)");
            }
            options.workerCount = *count;
        } else if (name == "--init-only" || name == "--exec-only" || name == "--log" || name == "--dry-run") {
            if (value) {
                return failure(ParseError::UnexpectedArgument, "option '" + name + "' does not take a value");
            }
            if (name == "--init-only") {
                initOnly = true;
            } else if (name == "--exec-only") {
                execOnly = true;
            } else if (name == "--log") {
                options.log = true;
            } else {
                options.dryRun = true;
            }
        } else {
            return failure(ParseError::UnknownOption, "unknown option '" + name + "'");
        }
    }

    if (initOnly && execOnly) {
        return failure(ParseError::ConflictingModes, "--init-only and --exec-only cannot be combined");
    }
    if (!haveInput || options.inputCase.empty()) {
        return failure(ParseError::MissingInputCase, "missing required argument <input_case>");
    }

    options.mode = initOnly ? RunMode::InitOnly : (execOnly ? RunMode::ExecOnly : RunMode::Both);
    result.ok = true;
    return result;
}

}
