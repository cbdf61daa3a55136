/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "poolflow/process.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

struct Job;

// Hooks run on the scheduling thread, exactly once each, outside the pool's
// state lock. They may submit jobs and query the pool but must not call
// Pool::tick().
using PreHook = std::function<void(const Job&)>;
using PostHook = std::function<void(const Job&, const ExitStatus&)>;

using Clock = std::chrono::system_clock;

// What a caller hands to the pool.
struct JobSpec {
    Cost cost = 0;
    Command command;
    PreHook preHook;
    PostHook postHook;
    std::string label;  // defaults to the command label
};

// Immutable account of a job that left the active set.
struct JobRecord {
    JobId id = 0;
    std::string label;
    Cost cost = 0;
    JobState state = JobState::Pending;
    std::optional<ExitStatus> exit;
    Clock::time_point submitted;
    std::optional<Clock::time_point> started;
    std::optional<Clock::time_point> finished;

    [[nodiscard]] std::optional<std::chrono::milliseconds> runningTime() const;
};

struct Job {
    Job(JobId id, JobSpec spec);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const JobId id;
    const Cost cost;
    Command command;
    PreHook preHook;
    PostHook postHook;
    std::string label;

    JobState state = JobState::Pending;
    // Present only while Running.
    std::unique_ptr<ProcessHandle> process;
    std::optional<ExitStatus> exit;

    Clock::time_point submitted;
    std::optional<Clock::time_point> started;
    std::optional<Clock::time_point> finished;

    [[nodiscard]] bool terminal() const noexcept {
        return state == JobState::Completed || state == JobState::Failed || state == JobState::Rejected;
    }
    [[nodiscard]] JobRecord record() const;
};

[[nodiscard]] std::string formatTime(Clock::time_point tp);

}
