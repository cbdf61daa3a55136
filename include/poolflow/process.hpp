/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "poolflow/config.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

// Outcome of a job's process.
struct ExitStatus {
    bool launched = true;   // false: the process never started
    int exitCode = 0;
    int signal = 0;         // terminating signal, 0 if exited normally
    std::string error;      // launch or poll failure description

    [[nodiscard]] bool ok() const noexcept { return launched && signal == 0 && exitCode == 0 && error.empty(); }
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] static ExitStatus exited(int code) noexcept;
    [[nodiscard]] static ExitStatus signaled(int sig) noexcept;
    [[nodiscard]] static ExitStatus launchFailure(const std::string& error);
    [[nodiscard]] static ExitStatus failure(const std::string& error);
};

// What a job runs: an external program (argv) or an in-process callable
// returning an exit code. Exactly one of the two is set.
struct Command {
    std::vector<std::string> argv;
    std::function<int()> callable;
    std::string name;                   // display name for callables
    std::filesystem::path outputPath;   // stdout+stderr of argv programs, empty: inherit

    [[nodiscard]] static Command exec(std::vector<std::string> argv);
    [[nodiscard]] static Command call(std::function<int()> fn, std::string name = "callable");

    [[nodiscard]] bool valid() const noexcept { return !argv.empty() != static_cast<bool>(callable); }
    [[nodiscard]] std::string label() const;
};

class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& what) : std::runtime_error(what) {}
};

// A launched process. poll() never blocks; once it has returned an exit
// status it keeps returning the same status.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    [[nodiscard]] virtual std::optional<ExitStatus> poll() = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Throws LaunchError if the command cannot be started.
    [[nodiscard]] virtual std::unique_ptr<ProcessHandle> launch(const Command& command, Cost cost) = 0;
};

// Launches argv commands with fork/exec and callables on their own thread.
class SystemLauncher final : public ProcessLauncher {
public:
    explicit SystemLauncher(LimitMode limits = LimitMode::Off);

    SystemLauncher(const SystemLauncher&) = delete;
    SystemLauncher& operator=(const SystemLauncher&) = delete;

    [[nodiscard]] std::unique_ptr<ProcessHandle> launch(const Command& command, Cost cost) override;

    [[nodiscard]] LimitMode limits() const noexcept { return limits_; }
    // False when limits were requested but the platform cannot apply them.
    [[nodiscard]] bool limitsEnforced() const noexcept { return enforced_; }

private:
    std::unique_ptr<ProcessHandle> spawn(const Command& command, Cost cost);
    std::unique_ptr<ProcessHandle> runCallable(const Command& command);

    LimitMode limits_;
    bool enforced_;
};

}
