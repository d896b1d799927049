/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/command.hpp"

namespace nexrun {

namespace {
bool needsQuoting(const std::string& token) {
    if (token.empty()) return true;
    for (char c : token) {
        switch (c) {
            case ' ': case '\t': case '\n': case '\'': case '"': case '\\':
            case '$': case '`': case '&': case '|': case ';': case '<':
            case '>': case '(': case ')': case '*': case '?': case '[':
            case ']': case '#': case '~': case '!': case '{': case '}':
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string quote(const std::string& token) {
    std::string out = "'";
    for (char c : token) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}
}

LaunchCommand composeCommand(const StageRequest& request, const std::string& launcher) {
    LaunchCommand cmd;
    if (request.workerCount > 1) {
        cmd = {launcher, "-np", std::to_string(request.workerCount)};
    }
    cmd.push_back(request.stageBinary);
    cmd.push_back(request.inputCase);
    cmd.push_back("-c");
    cmd.push_back(request.outputCase);
    cmd.push_back("-s");
    cmd.push_back(request.study);
    return cmd;
}

std::string formatCommand(const LaunchCommand& command) {
    std::string line;
    for (const auto& token : command) {
        if (!line.empty()) line += ' ';
        line += needsQuoting(token) ? quote(token) : token;
    }
    return line;
}

}
