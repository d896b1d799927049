/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nexrun/stage_runner.hpp"
#include "nexrun/command.hpp"
#include "nexrun/logger.hpp"
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nexrun {

namespace {
// pid of the child being waited on, 0 when idle. Read from signal handlers.
std::atomic<pid_t> g_active_child{0};
static_assert(std::atomic<pid_t>::is_always_lock_free, "signal handlers need a lock-free pid slot");

// First termination signal received by the driver, 0 when none.
std::atomic<int> g_termination_signal{0};
static_assert(std::atomic<int>::is_always_lock_free, "signal handlers need a lock-free flag");

class ScopedFd {
public:
    ScopedFd() = default;
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool makePipe(ScopedFd& readEnd, ScopedFd& writeEnd) noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

std::string errnoText(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

StageOutcome launchFailure(StageOutcome outcome, const std::string& message) {
    outcome.kind = OutcomeKind::LaunchFailed;
    outcome.message = message;
    LOG_DEBUG(std::string(stageName(outcome.stage)) + " launch failed: " + message);
    return outcome;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void reportExecFailure(int reportFd, int err) noexcept {
    ssize_t written = ::write(reportFd, &err, sizeof(err));
    (void)written;
    ::_exit(127);
}

void appendCapture(OutputSink& sink, const char* data, std::size_t size) {
    sink.captured.append(data, size);
    if (sink.limit > 0 && sink.captured.size() > sink.limit) {
        sink.captured.erase(0, sink.captured.size() - sink.limit);
    }
}

// Reads both capture pipes until the child closes them.
void drainCaptures(ScopedFd& outFd, OutputSink& out, ScopedFd& errFd, OutputSink& err) {
    struct Stream {
        ScopedFd* fd;
        OutputSink* sink;
    };
    std::array<Stream, 2> streams{{{&outFd, &out}, {&errFd, &err}}};
    std::array<char, 4096> chunk{};

    while (outFd.valid() || errFd.valid()) {
        std::array<pollfd, 2> fds{};
        std::array<Stream*, 2> owners{};
        nfds_t count = 0;
        for (auto& stream : streams) {
            if (stream.fd->valid()) {
                fds[count] = {stream.fd->get(), POLLIN, 0};
                owners[count] = &stream;
                ++count;
            }
        }

        if (::poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Closing the read ends lets a blocked writer see EPIPE instead of hanging.
            LOG_WARN(errnoText("poll on child output failed", errno));
            outFd.reset();
            errFd.reset();
            return;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n > 0) {
                appendCapture(*owners[i]->sink, chunk.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                owners[i]->fd->reset();
            }
        }
    }
}

bool waitChild(pid_t pid, int& status) noexcept {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

bool prepareSink(const OutputSink& sink, ScopedFd& readEnd, ScopedFd& writeEnd, std::string& error) {
    if (sink.kind == SinkKind::Descriptor) {
        if (sink.fd < 0) {
            error = "invalid output descriptor";
            return false;
        }
        return true;
    }
    if (!makePipe(readEnd, writeEnd)) {
        error = errnoText("pipe", errno);
        return false;
    }
    return true;
}
}

std::string describeOutcome(const StageOutcome& outcome) {
    std::string stage = stageName(outcome.stage);
    switch (outcome.kind) {
        case OutcomeKind::Success:
            return stage + " stage completed";
        case OutcomeKind::Failed:
            return stage + " stage failed with exit status " + std::to_string(outcome.exitStatus);
        case OutcomeKind::Signaled: {
            const char* name = ::strsignal(outcome.signal);
            std::string line = stage + " stage terminated by signal " + std::to_string(outcome.signal);
            if (name) {
                line += std::string(" (") + name + ")";
            }
            if (!outcome.message.empty()) {
                line += ": " + outcome.message;
            }
            return line;
        }
        case OutcomeKind::LaunchFailed:
            return stage + " stage could not be launched: " + outcome.message;
    }
    return stage + " stage: unknown outcome";
}

StageOutcome StageRunner::run(Stage stage, const LaunchCommand& command, OutputSinks& sinks) noexcept {
    StageOutcome outcome;
    outcome.stage = stage;

    try {
        if (command.empty() || command.front().empty()) {
            return launchFailure(outcome, "empty command");
        }

        LOG_INFO(std::string("Launching ") + stageName(stage) + " stage: " + formatCommand(command));

        // argv is built before fork so the child does not allocate
        std::vector<char*> argv;
        argv.reserve(command.size() + 1);
        for (const auto& token : command) {
            argv.push_back(const_cast<char*>(token.c_str()));
        }
        argv.push_back(nullptr);

        std::string error;
        ScopedFd outRead, outWrite, errRead, errWrite;
        if (!prepareSink(sinks.out, outRead, outWrite, error) ||
            !prepareSink(sinks.err, errRead, errWrite, error)) {
            return launchFailure(outcome, error);
        }

        ScopedFd execRead, execWrite;
        if (!makePipe(execRead, execWrite)) {
            return launchFailure(outcome, errnoText("pipe", errno));
        }

        const int childOut = outWrite.valid() ? outWrite.get() : sinks.out.fd;
        const int childErr = errWrite.valid() ? errWrite.get() : sinks.err.fd;

        pid_t pid = ::fork();
        if (pid < 0) {
            return launchFailure(outcome, errnoText("fork", errno));
        }

        if (pid == 0) {
            if (::dup2(childOut, STDOUT_FILENO) < 0 || ::dup2(childErr, STDERR_FILENO) < 0) {
                reportExecFailure(execWrite.get(), errno);
            }
            ::execvp(argv[0], argv.data());
            reportExecFailure(execWrite.get(), errno);
        }

        g_active_child.store(pid);
        LOG_DEBUG(std::string(stageName(stage)) + " stage child pid " + std::to_string(pid));

        // A request that arrived before the pid was published never reached the child
        if (const int pending = g_termination_signal.load(); pending != 0) {
            ::kill(pid, pending);
        }

        outWrite.reset();
        errWrite.reset();
        execWrite.reset();

        // EOF here means exec succeeded (the write end was close-on-exec)
        int execErrno = 0;
        ssize_t reported = 0;
        do {
            reported = ::read(execRead.get(), &execErrno, sizeof(execErrno));
        } while (reported < 0 && errno == EINTR);

        drainCaptures(outRead, sinks.out, errRead, sinks.err);

        int status = 0;
        const bool waited = waitChild(pid, status);
        const int waitErrno = errno;
        g_active_child.store(0);

        if (reported == static_cast<ssize_t>(sizeof(execErrno))) {
            return launchFailure(outcome, "cannot execute '" + command.front() + "': " + std::strerror(execErrno));
        }
        if (!waited) {
            return launchFailure(outcome, errnoText("waitpid", waitErrno));
        }

        if (WIFEXITED(status)) {
            outcome.exitStatus = WEXITSTATUS(status);
            outcome.kind = outcome.exitStatus == 0 ? OutcomeKind::Success : OutcomeKind::Failed;
        } else if (WIFSIGNALED(status)) {
            outcome.kind = OutcomeKind::Signaled;
            outcome.signal = WTERMSIG(status);
        } else {
            return launchFailure(outcome, "unexpected wait status " + std::to_string(status));
        }

        LOG_DEBUG(describeOutcome(outcome));
        return outcome;

    } catch (const std::exception& e) {
        g_active_child.store(0);
        LOG_ERROR("Exception running " + std::string(stageName(stage)) + " stage: " + e.what());
        outcome.kind = OutcomeKind::LaunchFailed;
        outcome.message = e.what();
        return outcome;
    } catch (...) {
        g_active_child.store(0);
        LOG_ERROR("Unknown exception running " + std::string(stageName(stage)) + " stage");
        outcome.kind = OutcomeKind::LaunchFailed;
        outcome.message = "unknown internal error";
        return outcome;
    }
}

void StageRunner::forwardSignal(int sig) noexcept {
    pid_t pid = g_active_child.load();
    if (pid > 0) {
        ::kill(pid, sig);
    }
}

void StageRunner::requestTermination(int sig) noexcept {
    int none = 0;
    g_termination_signal.compare_exchange_strong(none, sig);
    forwardSignal(sig);
}

int StageRunner::terminationSignal() noexcept {
    return g_termination_signal.load();
}

void StageRunner::clearTermination() noexcept {
    g_termination_signal.store(0);
}

StageOutcome interruptedOutcome(Stage stage, int sig) {
    StageOutcome outcome;
    outcome.stage = stage;
    outcome.kind = OutcomeKind::Signaled;
    outcome.signal = sig;
    outcome.message = "driver interrupted";
    return outcome;
}

}
