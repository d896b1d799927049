/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "nexrun/sinks.hpp"
#include "nexrun/types.hpp"

namespace nexrun {

enum class OutcomeKind : uint8_t {
    Success,      // ran and exited 0
    Failed,       // ran and exited non-zero
    Signaled,     // terminated by a signal
    LaunchFailed  // never started
};

struct StageOutcome {
    Stage stage = Stage::Init;
    OutcomeKind kind = OutcomeKind::Success;
    int exitStatus = 0;
    int signal = 0;
    std::string message;
    explicit operator bool() const noexcept { return kind == OutcomeKind::Success; }
};

// One line describing a non-successful outcome, naming the stage.
[[nodiscard]] std::string describeOutcome(const StageOutcome& outcome);

class StageRunner final {
public:
    StageRunner() = default;

    StageRunner(const StageRunner&) = delete;
    StageRunner& operator=(const StageRunner&) = delete;
    StageRunner(StageRunner&&) = delete;
    StageRunner& operator=(StageRunner&&) = delete;

    // Spawns command[0] (searched in PATH) and blocks until it exits.
    [[nodiscard]] StageOutcome run(Stage stage, const LaunchCommand& command, OutputSinks& sinks) noexcept;

    // Async-signal-safe: sends sig to the child currently being waited on, if any.
    static void forwardSignal(int sig) noexcept;

    // Async-signal-safe: records that the driver was told to terminate, then
    // forwards sig. A child started after the request is signalled as soon as
    // its pid is known. Only the first signal is kept.
    static void requestTermination(int sig) noexcept;
    // Signal of the pending termination request, 0 when none.
    [[nodiscard]] static int terminationSignal() noexcept;
    static void clearTermination() noexcept;
};

// Signaled outcome for a stage cut short by a driver termination request.
[[nodiscard]] StageOutcome interruptedOutcome(Stage stage, int sig);

}
