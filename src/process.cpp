/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/process.hpp"
#include "poolflow/logger.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace poolflow {

std::string ExitStatus::describe() const {
    if (!launched) {
        return "launch failed: " + error;
    }
    if (!error.empty()) {
        return "error: " + error;
    }
    if (signal != 0) {
        return "killed by signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
    }
    return "exit " + std::to_string(exitCode);
}

ExitStatus ExitStatus::exited(int code) noexcept {
    ExitStatus status;
    status.exitCode = code;
    return status;
}

ExitStatus ExitStatus::signaled(int sig) noexcept {
    ExitStatus status;
    status.exitCode = 128 + sig;
    status.signal = sig;
    return status;
}

ExitStatus ExitStatus::launchFailure(const std::string& error) {
    ExitStatus status;
    status.launched = false;
    status.exitCode = 127;
    status.error = error;
    return status;
}

ExitStatus ExitStatus::failure(const std::string& error) {
    ExitStatus status;
    status.exitCode = 1;
    status.error = error;
    return status;
}

Command Command::exec(std::vector<std::string> argv) {
    Command command;
    command.argv = std::move(argv);
    return command;
}

Command Command::call(std::function<int()> fn, std::string name) {
    Command command;
    command.callable = std::move(fn);
    command.name = std::move(name);
    return command;
}

std::string Command::label() const {
    if (callable) {
        return name;
    }
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

namespace {

class ChildProcess final : public ProcessHandle {
public:
    explicit ChildProcess(pid_t pid) noexcept : pid_(pid) {}

    ~ChildProcess() override {
        if (status_ || poll()) {
            return;
        }
        // Running jobs are never killed. The child is left to finish on its
        // own and reaped in the background so it does not linger as a zombie.
        LOG_WARN("Detaching from running process " + std::to_string(pid_));
        try {
            pid_t pid = pid_;
            std::thread([pid]() {
                int raw = 0;
                while (::waitpid(pid, &raw, 0) == -1 && errno == EINTR) {
                }
            }).detach();
        } catch (const std::system_error& e) {
            LOG_WARN("Cannot reap process " + std::to_string(pid_) + ": " + e.what());
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    std::optional<ExitStatus> poll() override {
        if (status_) {
            return status_;
        }

        int raw = 0;
        pid_t r = ::waitpid(pid_, &raw, WNOHANG);
        if (r == 0) {
            return std::nullopt;
        }
        if (r == -1) {
            if (errno == EINTR) {
                return std::nullopt;
            }
            status_ = ExitStatus::failure(std::string("waitpid: ") + std::strerror(errno));
            return status_;
        }

        if (WIFEXITED(raw)) {
            status_ = ExitStatus::exited(WEXITSTATUS(raw));
        } else if (WIFSIGNALED(raw)) {
            status_ = ExitStatus::signaled(WTERMSIG(raw));
        } else {
            // Stopped or continued; still alive.
            return std::nullopt;
        }
        return status_;
    }

    std::string describe() const override {
        return "pid " + std::to_string(pid_);
    }

private:
    pid_t pid_;
    std::optional<ExitStatus> status_;
};

class CallableProcess final : public ProcessHandle {
public:
    CallableProcess(std::function<int()> fn, std::string name)
        : name_(std::move(name)), state_(std::make_shared<State>()) {
        auto state = state_;
        auto threadName = "Job-" + name_;
        thread_ = std::thread([state, fn = std::move(fn), threadName]() {
            setThreadName(threadName);
            try {
                state->code = fn();
            } catch (const std::exception& e) {
                state->error = e.what();
            } catch (...) {
                state->error = "unknown exception";
            }
            state->done.store(true, std::memory_order_release);
        });
    }

    ~CallableProcess() override {
        if (!thread_.joinable()) {
            return;
        }
        if (state_->done.load(std::memory_order_acquire)) {
            thread_.join();
            return;
        }
        // Like a child process, a running callable is not waited for. The
        // thread only touches its own shared state from here on.
        LOG_WARN("Detaching from running " + describe());
        thread_.detach();
    }

    CallableProcess(const CallableProcess&) = delete;
    CallableProcess& operator=(const CallableProcess&) = delete;

    std::optional<ExitStatus> poll() override {
        if (!state_->done.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (!state_->error.empty()) {
            return ExitStatus::failure(state_->error);
        }
        return ExitStatus::exited(state_->code);
    }

    std::string describe() const override {
        return "thread " + name_;
    }

private:
    struct State {
        std::atomic<bool> done{false};
        int code = 0;
        std::string error;
    };

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread thread_;
};

void setCloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags != -1) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

bool platformSupportsLimits() noexcept {
#ifdef RLIMIT_AS
    return true;
#else
    return false;
#endif
}

}

SystemLauncher::SystemLauncher(LimitMode limits)
    : limits_(limits), enforced_(limits == LimitMode::Off || platformSupportsLimits()) {
    if (!enforced_) {
        LOG_WARN(std::string("Per-job memory limits (") + toString(limits) +
                 ") are not supported on this platform; jobs run without limits");
    }
}

std::unique_ptr<ProcessHandle> SystemLauncher::launch(const Command& command, Cost cost) {
    if (!command.valid()) {
        throw LaunchError("command has neither argv nor callable");
    }
    if (command.callable) {
        return runCallable(command);
    }
    return spawn(command, cost);
}

std::unique_ptr<ProcessHandle> SystemLauncher::runCallable(const Command& command) {
    try {
        return std::make_unique<CallableProcess>(command.callable, command.name);
    } catch (const std::system_error& e) {
        throw LaunchError("cannot start thread for " + command.name + ": " + e.what());
    }
}

std::unique_ptr<ProcessHandle> SystemLauncher::spawn(const Command& command, Cost cost) {
    // Everything the child needs is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outFd = -1;
    if (!command.outputPath.empty()) {
        outFd = ::open(command.outputPath.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (outFd == -1) {
            throw LaunchError("cannot open output " + command.outputPath.string() + ": " + std::strerror(errno));
        }
        setCloexec(outFd);
    }

    bool applyLimit = limits_ != LimitMode::Off && enforced_ && cost > 0;
#ifdef RLIMIT_AS
    struct rlimit limit {};
    if (applyLimit) {
        if (::getrlimit(RLIMIT_AS, &limit) != 0) {
            limit.rlim_max = RLIM_INFINITY;
        }
        limit.rlim_cur = static_cast<rlim_t>(cost);
        if (limits_ == LimitMode::Hard || (limit.rlim_max != RLIM_INFINITY && limit.rlim_max < limit.rlim_cur)) {
            limit.rlim_max = limit.rlim_cur;
        }
    }
#endif

    int errPipe[2];
    if (::pipe(errPipe) == -1) {
        int err = errno;
        if (outFd != -1) ::close(outFd);
        throw LaunchError(std::string("pipe: ") + std::strerror(err));
    }
    setCloexec(errPipe[0]);
    setCloexec(errPipe[1]);

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        if (outFd != -1) ::close(outFd);
        throw LaunchError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // child
        ::close(errPipe[0]);

        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        if (outFd != -1) {
            ::dup2(outFd, STDOUT_FILENO);
            ::dup2(outFd, STDERR_FILENO);
        }

#ifdef RLIMIT_AS
        if (applyLimit && ::setrlimit(RLIMIT_AS, &limit) != 0) {
            int err = errno;
            ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
#endif

        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // parent
    ::close(errPipe[1]);
    if (outFd != -1) {
        ::close(outFd);
    }

    // The pipe closes on successful exec; otherwise the child reports errno.
    int childErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(errPipe[0], &childErr, sizeof(childErr));
    } while (n == -1 && errno == EINTR);
    ::close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int ignored = 0;
        while (::waitpid(pid, &ignored, 0) == -1 && errno == EINTR) {
        }
        throw LaunchError("cannot execute " + command.argv[0] + ": " + std::strerror(childErr));
    }

    LOG_DEBUG("Spawned pid " + std::to_string(pid) + ": " + command.label());
    return std::make_unique<ChildProcess>(pid);
}

}
