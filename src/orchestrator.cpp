/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/orchestrator.hpp"
#include "nexrun/logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace nexrun {

namespace {
constexpr std::size_t kStderrTailLines = 20;

std::string tailLines(const std::string& text, std::size_t maxLines) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::size_t first = lines.size() > maxLines ? lines.size() - maxLines : 0;
    std::string tail;
    for (std::size_t i = first; i < lines.size(); ++i) {
        if (!tail.empty()) tail += '\n';
        tail += lines[i];
    }
    return tail;
}

bool stageCompleted(const RunReport& report, Stage stage) {
    return std::find(report.completed.begin(), report.completed.end(), stage) != report.completed.end();
}
}

RunPlan normalize(const RunOptions& options) {
    RunPlan plan;
    plan.inputCase = options.inputCase;
    plan.outputCase = options.outputCase && !options.outputCase->empty() ? *options.outputCase : options.inputCase;
    plan.study = options.study && !options.study->empty() ? *options.study : options.inputCase;
    plan.mode = options.mode;
    plan.workerCount = options.workerCount;
    plan.log = options.log;
    plan.dryRun = options.dryRun;
    return plan;
}

int exitCodeFor(const RunReport& report) noexcept {
    if (report.state == RunState::Done) {
        return 0;
    }
    if (!report.failure) {
        return kExitConfigError;
    }
    switch (report.failure->kind) {
        case OutcomeKind::Success:
            return 0;
        case OutcomeKind::Failed:
            return report.failure->exitStatus != 0 ? report.failure->exitStatus : 1;
        case OutcomeKind::Signaled:
            return 128 + report.failure->signal;
        case OutcomeKind::LaunchFailed:
            return kExitLaunchFailure;
    }
    return kExitConfigError;
}

std::string summarize(const RunReport& report) {
    if (report.state == RunState::Failed) {
        if (!report.failure) {
            return report.error;
        }
        std::string line = describeOutcome(*report.failure);
        if (report.failure->stage == Stage::Exec && stageCompleted(report, Stage::Init)) {
            line += " (init stage had completed)";
        } else if (report.failure->stage == Stage::Init && runsStage(report.mode, Stage::Exec)) {
            line += "; exec stage not started";
        }
        return line;
    }
    if (report.state != RunState::Done) {
        return "run did not finish";
    }
    if (report.dryRun) {
        return "dry run: " + std::to_string(report.commands.size()) + " command(s) composed, none launched";
    }
    switch (report.mode) {
        case RunMode::InitOnly:
            return "init stage completed; exec stage not requested";
        case RunMode::ExecOnly:
            return "exec stage completed; init stage not requested";
        case RunMode::Both:
            break;
    }
    return "init and exec stages completed";
}

Orchestrator::Orchestrator(ToolConfig config)
    : Orchestrator(std::move(config), StageExecutor{}) {
}

Orchestrator::Orchestrator(ToolConfig config, StageExecutor executor)
    : config_(std::move(config)), executor_(std::move(executor)) {
    if (!executor_) {
        executor_ = [this](Stage stage, const LaunchCommand& command, OutputSinks& sinks) {
            return runner_.run(stage, command, sinks);
        };
    }
    LOG_DEBUG("Orchestrator created - init: " + config_.standExe + ", exec: " + config_.nexusExe +
              ", launcher: " + config_.launcher);
}

std::filesystem::path Orchestrator::stdoutLogPath(const std::string& inputCase) {
    return std::filesystem::path(inputCase + ".o.log");
}

std::filesystem::path Orchestrator::stderrLogPath(const std::string& inputCase) {
    return std::filesystem::path(inputCase + ".e.log");
}

StageRequest Orchestrator::requestFor(Stage stage, const RunPlan& plan) const {
    StageRequest request;
    request.stageBinary = config_.binaryFor(stage);
    request.inputCase = plan.inputCase;
    request.outputCase = plan.outputCase;
    request.study = plan.study;
    request.workerCount = plan.workerCount;
    return request;
}

RunReport Orchestrator::run(const RunOptions& options) {
    const RunPlan plan = normalize(options);
    LOG_DEBUG("Run plan - input: " + plan.inputCase + ", output: " + plan.outputCase +
              ", study: " + plan.study + ", workers: " + std::to_string(plan.workerCount));

    if (plan.dryRun) {
        return dryRun(plan);
    }

    RunReport report;
    report.mode = plan.mode;

    // Declared before the sinks and the state machine so they close on every exit path
    std::optional<LogFile> outLog;
    std::optional<LogFile> errLog;
    OutputSinks sinks{OutputSink::capture(kCaptureLimit), OutputSink::capture(kCaptureLimit)};

    if (plan.log) {
        outLog.emplace(stdoutLogPath(plan.inputCase));
        errLog.emplace(stderrLogPath(plan.inputCase));
        for (const LogFile* file : {&*outLog, &*errLog}) {
            if (!file->isOpen()) {
                report.state = RunState::Failed;
                report.error = "cannot open log file " + file->path().string() + ": " + file->error();
                return report;
            }
        }
        sinks.out = OutputSink::descriptor(outLog->fd());
        sinks.err = OutputSink::descriptor(errLog->fd());
    }

    report.state = runsStage(plan.mode, Stage::Init) ? RunState::InitPending : RunState::ExecPending;

    while (report.state != RunState::Done && report.state != RunState::Failed) {
        switch (report.state) {
            case RunState::InitPending:
                if (!runStage(Stage::Init, plan, sinks, report)) {
                    report.state = RunState::Failed;
                } else {
                    report.state = runsStage(plan.mode, Stage::Exec) ? RunState::ExecPending : RunState::Done;
                }
                break;
            case RunState::ExecPending:
                report.state = runStage(Stage::Exec, plan, sinks, report) ? RunState::Done : RunState::Failed;
                break;
            default:
                report.state = RunState::Failed;
                report.error = "invalid run state";
                break;
        }
    }

    LOG_INFO(summarize(report));
    return report;
}

bool Orchestrator::runStage(Stage stage, const RunPlan& plan, OutputSinks& sinks, RunReport& report) {
    ScopedLogContext context(stageName(stage));

    if (const int sig = StageRunner::terminationSignal(); sig != 0) {
        LOG_DEBUG("Termination requested before launch");
        report.failure = interruptedOutcome(stage, sig);
        return false;
    }

    LaunchCommand command = composeCommand(requestFor(stage, plan), config_.launcher);
    report.commands.push_back(command);

    // Captured text belongs to one stage only
    sinks.out.captured.clear();
    sinks.err.captured.clear();

    StageOutcome outcome = executor_(stage, command, sinks);
    outcome.stage = stage;

    // The child may have handled the forwarded signal and exited on its own
    if (const int sig = StageRunner::terminationSignal(); sig != 0 && outcome.kind != OutcomeKind::Signaled) {
        outcome = interruptedOutcome(stage, sig);
    }

    if (outcome) {
        report.completed.push_back(stage);
        LOG_DEBUG(describeOutcome(outcome));
        return true;
    }

    LOG_DEBUG(describeOutcome(outcome));
    if (sinks.err.kind == SinkKind::Capture) {
        std::string tail = tailLines(sinks.err.captured, kStderrTailLines);
        if (!tail.empty()) {
            LOG_ERROR(std::string(stageName(stage)) + " stage stderr (last lines):\n" + tail);
        }
    }
    report.failure = std::move(outcome);
    return false;
}

RunReport Orchestrator::dryRun(const RunPlan& plan) const {
    RunReport report;
    report.mode = plan.mode;
    report.dryRun = true;
    for (Stage stage : {Stage::Init, Stage::Exec}) {
        if (runsStage(plan.mode, stage)) {
            report.commands.push_back(composeCommand(requestFor(stage, plan), config_.launcher));
        }
    }
    report.state = RunState::Done;
    return report;
}

}
