/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

/**
 * @file test_stage_runner.cpp
 * @brief Tests for child process launching, output routing and outcome classification
 */

#include <gtest/gtest.h>
#include "nexrun/stage_runner.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace nexrun;
using nexrun::test::TempDir;
using nexrun::test::readFile;
using nexrun::test::writeScript;

class StageRunnerTest : public ::testing::Test {
protected:
    StageOutcome runShell(const std::string& script, OutputSinks& sinks, Stage stage = Stage::Init) {
        return runner.run(stage, {"/bin/sh", "-c", script}, sinks);
    }

    void TearDown() override {
        StageRunner::clearTermination();
    }

    StageRunner runner;
    TempDir dir;
};

TEST_F(StageRunnerTest, SuccessCapturesBothStreams) {
    OutputSinks sinks;
    StageOutcome outcome = runShell("echo to-stdout; echo to-stderr >&2", sinks);

    EXPECT_TRUE(outcome);
    EXPECT_EQ(outcome.kind, OutcomeKind::Success);
    EXPECT_EQ(outcome.exitStatus, 0);
    EXPECT_EQ(sinks.out.captured, "to-stdout\n");
    EXPECT_EQ(sinks.err.captured, "to-stderr\n");
}

TEST_F(StageRunnerTest, NonZeroExitIsFailedWithStatus) {
    OutputSinks sinks;
    StageOutcome outcome = runShell("echo boom >&2; exit 3", sinks, Stage::Exec);

    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.kind, OutcomeKind::Failed);
    EXPECT_EQ(outcome.exitStatus, 3);
    EXPECT_EQ(outcome.stage, Stage::Exec);
    EXPECT_EQ(sinks.err.captured, "boom\n");
    EXPECT_EQ(describeOutcome(outcome), "exec stage failed with exit status 3");
}

TEST_F(StageRunnerTest, MissingExecutableIsLaunchFailure) {
    OutputSinks sinks;
    auto missing = (dir.path() / "no-such-standexe").string();
    StageOutcome outcome = runner.run(Stage::Init, {missing, "caseA"}, sinks);

    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.kind, OutcomeKind::LaunchFailed)
        << "a binary that cannot start must not look like one that ran and failed";
    EXPECT_NE(outcome.message.find(missing), std::string::npos);
    EXPECT_NE(describeOutcome(outcome).find("init stage could not be launched"), std::string::npos);
}

TEST_F(StageRunnerTest, NonExecutableFileIsLaunchFailure) {
    auto path = dir.path() / "not-executable";
    {
        std::ofstream file(path);
        file << "#!/bin/sh\nexit 0\n";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace);

    OutputSinks sinks;
    StageOutcome outcome = runner.run(Stage::Exec, {path.string()}, sinks);
    EXPECT_EQ(outcome.kind, OutcomeKind::LaunchFailed);
}

TEST_F(StageRunnerTest, EmptyCommandIsLaunchFailure) {
    OutputSinks sinks;
    EXPECT_EQ(runner.run(Stage::Init, {}, sinks).kind, OutcomeKind::LaunchFailed);
    EXPECT_EQ(runner.run(Stage::Init, {""}, sinks).kind, OutcomeKind::LaunchFailed);
}

TEST_F(StageRunnerTest, BareNameIsResolvedThroughPath) {
    OutputSinks sinks;
    StageOutcome outcome = runner.run(Stage::Init, {"sh", "-c", "printf ok"}, sinks);
    EXPECT_TRUE(outcome) << describeOutcome(outcome);
    EXPECT_EQ(sinks.out.captured, "ok");
}

TEST_F(StageRunnerTest, ArgumentsArePassedVerbatim) {
    auto script = writeScript(dir.path() / "echo-args", "for a in \"$@\"; do echo \"[$a]\"; done");
    OutputSinks sinks;
    StageOutcome outcome = runner.run(Stage::Init, {script.string(), "case A", "-c", "", "-s", "x*"}, sinks);
    ASSERT_TRUE(outcome) << describeOutcome(outcome);
    EXPECT_EQ(sinks.out.captured, "[case A]\n[-c]\n[]\n[-s]\n[x*]\n");
}

TEST_F(StageRunnerTest, SignalTerminationIsReported) {
    OutputSinks sinks;
    StageOutcome outcome = runShell("kill -TERM $$", sinks);

    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.kind, OutcomeKind::Signaled);
    EXPECT_EQ(outcome.signal, SIGTERM);
    EXPECT_NE(describeOutcome(outcome).find("terminated by signal 15"), std::string::npos);
}

TEST_F(StageRunnerTest, HeavyOutputOnBothStreamsDoesNotDeadlock) {
    OutputSinks sinks;
    StageOutcome outcome = runShell(
        "i=0; while [ $i -lt 4000 ]; do "
        "echo 0123456789012345678901234567890123456789012345678; "
        "echo abcdefghijabcdefghijabcdefghijabcdefghijabcdefghi >&2; "
        "i=$((i+1)); done",
        sinks);

    ASSERT_TRUE(outcome) << describeOutcome(outcome);
    EXPECT_EQ(sinks.out.captured.size(), 4000u * 50u);
    EXPECT_EQ(sinks.err.captured.size(), 4000u * 50u);
}

TEST_F(StageRunnerTest, DescriptorSinksWriteToFiles) {
    LogFile out(dir.path() / "run.o.log");
    LogFile err(dir.path() / "run.e.log");
    ASSERT_TRUE(out.isOpen());
    ASSERT_TRUE(err.isOpen());

    OutputSinks sinks{OutputSink::descriptor(out.fd()), OutputSink::descriptor(err.fd())};
    ASSERT_TRUE(runShell("echo first; echo oops >&2", sinks));
    ASSERT_TRUE(runShell("echo second", sinks, Stage::Exec));
    out.close();
    err.close();

    EXPECT_FALSE(out.isOpen());
    EXPECT_EQ(readFile(dir.path() / "run.o.log"), "first\nsecond\n");
    EXPECT_EQ(readFile(dir.path() / "run.e.log"), "oops\n");
    EXPECT_TRUE(sinks.out.captured.empty());
}

TEST_F(StageRunnerTest, InvalidDescriptorIsLaunchFailure) {
    OutputSinks sinks{OutputSink::descriptor(-1), OutputSink::capture()};
    EXPECT_EQ(runShell("exit 0", sinks).kind, OutcomeKind::LaunchFailed);
}

TEST_F(StageRunnerTest, ForwardedSignalEndsBlockedStage) {
    std::atomic<bool> finished{false};
    std::thread interrupter([&finished] {
        // The child may not exist yet on the first attempts
        while (!finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            StageRunner::forwardSignal(SIGTERM);
        }
    });

    OutputSinks sinks;
    StageOutcome outcome = runner.run(Stage::Exec, {"sleep", "30"}, sinks);
    finished.store(true);
    interrupter.join();

    EXPECT_EQ(outcome.kind, OutcomeKind::Signaled);
    EXPECT_EQ(outcome.signal, SIGTERM);
}

TEST_F(StageRunnerTest, TerminationRequestedBeforeLaunchReachesChild) {
    // No child is running yet, so the request can only be acted on after fork
    StageRunner::requestTermination(SIGTERM);
    EXPECT_EQ(StageRunner::terminationSignal(), SIGTERM);

    auto started = std::chrono::steady_clock::now();
    OutputSinks sinks;
    StageOutcome outcome = runner.run(Stage::Init, {"sleep", "30"}, sinks);

    EXPECT_EQ(outcome.kind, OutcomeKind::Signaled);
    EXPECT_EQ(outcome.signal, SIGTERM);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(StageRunnerTest, FirstTerminationSignalIsKept) {
    StageRunner::requestTermination(SIGINT);
    StageRunner::requestTermination(SIGTERM);
    EXPECT_EQ(StageRunner::terminationSignal(), SIGINT);

    StageRunner::clearTermination();
    EXPECT_EQ(StageRunner::terminationSignal(), 0);
}

TEST_F(StageRunnerTest, BoundedCaptureKeepsNewestOutput) {
    OutputSinks sinks{OutputSink::capture(64), OutputSink::capture(64)};
    StageOutcome outcome = runShell(
        "i=0; while [ $i -lt 500 ]; do echo line-$i; echo err-$i >&2; i=$((i+1)); done", sinks);

    ASSERT_TRUE(outcome) << describeOutcome(outcome);
    EXPECT_EQ(sinks.out.captured.size(), 64u);
    EXPECT_EQ(sinks.err.captured.size(), 64u);
    EXPECT_EQ(sinks.out.captured.substr(sinks.out.captured.size() - 9), "line-499\n");
    EXPECT_EQ(sinks.err.captured.substr(sinks.err.captured.size() - 8), "err-499\n");
}

TEST(DescribeOutcomeTest, InterruptedStageNamesSignal) {
    StageOutcome outcome = interruptedOutcome(Stage::Init, SIGTERM);
    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.kind, OutcomeKind::Signaled);

    std::string line = describeOutcome(outcome);
    EXPECT_EQ(line.rfind("init stage terminated by signal 15", 0), 0u);
    EXPECT_NE(line.find("driver interrupted"), std::string::npos);
}

TEST(LogFileTest, OpenFailureReportsError) {
    LogFile file("/nonexistent-dir-for-nexrun/case.o.log");
    EXPECT_FALSE(file.isOpen());
    EXPECT_FALSE(file.error().empty());
}

TEST(LogFileTest, MoveTransfersOwnership) {
    TempDir dir;
    LogFile first(dir.path() / "a.log");
    ASSERT_TRUE(first.isOpen());
    int fd = first.fd();

    LogFile second(std::move(first));
    EXPECT_FALSE(first.isOpen());
    EXPECT_EQ(second.fd(), fd);
}

TEST(LogFileTest, OpeningTruncates) {
    TempDir dir;
    auto path = dir.path() / "case.o.log";
    {
        std::ofstream stale(path);
        stale << "from an earlier run\n";
    }
    {
        LogFile file(path);
        ASSERT_TRUE(file.isOpen());
    }
    EXPECT_EQ(readFile(path), "");
}
