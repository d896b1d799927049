/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/cli.hpp"
#include "nexrun/logger.hpp"
#include "nexrun/options.hpp"
#include "nexrun/orchestrator.hpp"
#include "nexrun/stage_runner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

namespace nexrun {

namespace {
// Async-signal-safe: records the request and passes it to the running child
void signalHandler(int signal) {
    StageRunner::requestTermination(signal);
}
}

bool installSignalHandlers() noexcept {
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    bool installed = true;
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            LOG_WARN(std::string("Cannot install handler for signal ") + std::to_string(sig) + ": " +
                     std::strerror(errno));
            installed = false;
        }
    }
    return installed;
}

void printUsage(const std::string& progName, std::ostream& os) {
    os << "nexrun Simulation Driver v" << kVersion << "\n\n";
    os << "Usage: " << progName << " <input_case> [options]\n";
    os << "       " << progName << " --help | --version\n\n";
    os << "Arguments:\n";
    os << "  input_case              Input case name\n\n";
    os << "Options:\n";
    os << "  -o, --output-case NAME  Output case name (default: input case)\n";
    os << "  -s, --study NAME        Study name or VDB directory name (default: input case)\n";
    os << "      --init-only         Run initialization only\n";
    os << "      --exec-only         Run the simulation without initialization\n";
    os << "  -n, --num-cpus N        Number of processes (default: 1)\n";
    os << "      --log               Write <input_case>.o.log and <input_case>.e.log\n";
    os << "      --dry-run           Print the stage commands without running them\n";
    os << "  -h, --help              Show this help message\n";
    os << "  -v, --version           Show version\n\n";
    os << "Environment Variables:\n";
    os << "  STAND_EXE           Initialization binary (required)\n";
    os << "  NEXUS_EXE           Simulation binary (required)\n";
    os << "  NEXRUN_MPIEXEC      Parallel launcher used when N > 1 (default: mpiexec)\n";
    os << "  NEXRUN_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    os << "Examples:\n";
    os << "  " << progName << " caseA\n";
    os << "  " << progName << " caseA -o caseA_run2 -n 8 --log\n";
    os << "  " << progName << " caseA --exec-only -s study1\n";
}

int runCli(const std::string& progName, const std::vector<std::string>& args,
           const EnvLookup& env, std::ostream& out, std::ostream& err) {
    ParseResult parsed = parseArguments(args);
    if (!parsed) {
        err << "Error: " << parsed.message << "\n\n";
        printUsage(progName, err);
        return kExitUsage;
    }
    if (parsed.action == ParseAction::ShowHelp) {
        printUsage(progName, out);
        return 0;
    }
    if (parsed.action == ParseAction::ShowVersion) {
        out << kVersion << "\n";
        return 0;
    }

    ConfigResult config = loadToolConfig(env);
    if (!config) {
        err << "Error: " << config.message << std::endl;
        return kExitConfigError;
    }

    try {
        Orchestrator orchestrator(config.config);
        RunReport report = orchestrator.run(parsed.options);

        if (report.dryRun) {
            for (const auto& command : report.commands) {
                out << formatCommand(command) << "\n";
            }
        }

        if (!report) {
            err << "Error: " << summarize(report) << std::endl;
            return exitCodeFor(report);
        }
        return 0;

    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return kExitConfigError;
    }
}

}
