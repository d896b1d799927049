/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "nexrun/command.hpp"
#include "nexrun/config.hpp"
#include "nexrun/sinks.hpp"
#include "nexrun/stage_runner.hpp"
#include "nexrun/types.hpp"

namespace nexrun {

inline constexpr int kExitConfigError = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitLaunchFailure = 127;

// Bytes of each stream kept per stage when output is captured rather than logged
inline constexpr std::size_t kCaptureLimit = 64 * 1024;

// Caller-supplied parameters of one run. Unset names fall back to inputCase.
struct RunOptions {
    std::string inputCase;
    std::optional<std::string> outputCase;
    std::optional<std::string> study;
    RunMode mode = RunMode::Both;
    int workerCount = 1;
    bool log = false;
    bool dryRun = false;
};

// RunOptions with every default resolved.
struct RunPlan {
    std::string inputCase;
    std::string outputCase;
    std::string study;
    RunMode mode = RunMode::Both;
    int workerCount = 1;
    bool log = false;
    bool dryRun = false;
};

[[nodiscard]] RunPlan normalize(const RunOptions& options);

enum class RunState : uint8_t { Start, InitPending, ExecPending, Done, Failed };

struct RunReport {
    RunState state = RunState::Start;
    RunMode mode = RunMode::Both;
    bool dryRun = false;
    std::vector<Stage> completed;
    std::vector<LaunchCommand> commands;  // in launch order
    std::optional<StageOutcome> failure;
    std::string error;                    // failures outside a stage (log files)
    explicit operator bool() const noexcept { return state == RunState::Done; }
};

[[nodiscard]] int exitCodeFor(const RunReport& report) noexcept;

// One line stating what ran, what was skipped and what failed.
[[nodiscard]] std::string summarize(const RunReport& report);

using StageExecutor = std::function<StageOutcome(Stage, const LaunchCommand&, OutputSinks&)>;

class Orchestrator final {
public:
    explicit Orchestrator(ToolConfig config);
    // executor replaces process launching; an empty one falls back to StageRunner
    Orchestrator(ToolConfig config, StageExecutor executor);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] RunReport run(const RunOptions& options);

    [[nodiscard]] StageRequest requestFor(Stage stage, const RunPlan& plan) const;

    [[nodiscard]] static std::filesystem::path stdoutLogPath(const std::string& inputCase);
    [[nodiscard]] static std::filesystem::path stderrLogPath(const std::string& inputCase);

private:
    [[nodiscard]] bool runStage(Stage stage, const RunPlan& plan, OutputSinks& sinks, RunReport& report);
    [[nodiscard]] RunReport dryRun(const RunPlan& plan) const;

    ToolConfig config_;
    StageRunner runner_;
    StageExecutor executor_;
};

}
