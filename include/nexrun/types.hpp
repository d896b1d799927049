#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace nexrun {

// The two ordered steps of a run.
enum class Stage : std::uint8_t { Init, Exec };

// Which stages a run selects.
enum class RunMode : std::uint8_t { Both, InitOnly, ExecOnly };

// Executable path followed by its arguments.
using LaunchCommand = std::vector<std::string>;

[[nodiscard]] inline const char* stageName(Stage stage) noexcept {
    return stage == Stage::Init ? "init" : "exec";
}

[[nodiscard]] inline bool runsStage(RunMode mode, Stage stage) noexcept {
    if (stage == Stage::Init) return mode != RunMode::ExecOnly;
    return mode != RunMode::InitOnly;
}

} // namespace nexrun
