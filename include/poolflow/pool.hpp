/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "poolflow/accountant.hpp"
#include "poolflow/config.hpp"
#include "poolflow/job.hpp"
#include "poolflow/process.hpp"
#include "poolflow/reporter.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

struct SubmitResult {
    bool ok = false;
    JobId id = 0;
    SubmitError error = SubmitError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Admission-controlled scheduler. Each tick polls running jobs, releases the
// budget of those that exited, then admits pending jobs first-fit.
//
// A Static pool takes its whole job list at construction and terminates once
// every job has finished. A Dynamic pool accepts submit() until end(), then
// drains and terminates.
//
// tick() is the only mutator of scheduling state: drive it directly, or call
// start() to run it on a background thread. submit() and end() may be called
// from any thread at any time.
class Pool {
public:
    Pool(PoolMode mode,
         std::vector<JobSpec> jobs,
         std::unique_ptr<ResourceAccountant> accountant,
         std::unique_ptr<ProcessLauncher> launcher,
         const PoolConfig& config = PoolConfig());
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    // Accountant from config.capacity, SystemLauncher with config.limits.
    [[nodiscard]] static std::unique_ptr<Pool> create(PoolMode mode, const PoolConfig& config,
                                                      std::vector<JobSpec> jobs = {});

    [[nodiscard]] SubmitResult submit(JobSpec spec);
    // Dynamic pools only; idempotent.
    bool end();
    // Drops every job not yet admitted; they are recorded as Rejected.
    // Running jobs are untouched. Returns the number dropped.
    std::size_t clearPending();

    // One monitor-then-admit pass. Throws AccountingError if the budget
    // bookkeeping is found corrupted; the pool is then faulted and every
    // later tick throws again.
    Lifecycle tick();

    [[nodiscard]] Snapshot snapshot() const;
    [[nodiscard]] std::vector<JobRecord> records() const;
    [[nodiscard]] std::optional<JobState> state(JobId id) const;

    // Background scheduling loop.
    [[nodiscard]] bool start();
    void stop() noexcept;
    // Blocks until the loop has ended (terminated, faulted or stopped).
    Lifecycle wait();
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout);

    void setReporter(std::shared_ptr<StatusReporter> reporter);

    [[nodiscard]] PoolMode mode() const noexcept { return mode_; }
    [[nodiscard]] Lifecycle lifecycle() const noexcept { return lifecycle_.load(); }
    [[nodiscard]] bool isRunning() const noexcept { return loopRunning_.load(); }
    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::optional<std::string> fault() const;
    [[nodiscard]] const ResourceAccountant& accountant() const noexcept { return *accountant_; }

private:
    struct Finished {
        std::unique_ptr<Job> job;
        ExitStatus status;
    };

    SubmitResult enqueueLocked(JobSpec spec);
    bool drainInbox();
    std::vector<Finished> monitor();
    std::vector<Job*> admit();
    // Runs the pre-hook and starts the process; false if the job failed instead.
    bool launch(Job& job);
    void settle(Job& job, const ExitStatus& status);
    void runPostHook(const Job& job, const ExitStatus& status);
    void retire(const Job& job);
    void updateLifecycle(bool closed);
    void runLoop();
    void emitStatus(bool final) noexcept;

    const PoolMode mode_;
    std::unique_ptr<ResourceAccountant> accountant_;
    std::unique_ptr<ProcessLauncher> launcher_;
    const std::chrono::milliseconds tickInterval_;
    const std::chrono::milliseconds refreshInterval_;

    std::atomic<Lifecycle> lifecycle_{Lifecycle::Idle};
    std::atomic<std::uint64_t> ticks_{0};

    // Lock order: tickMutex_, stateMutex_, inboxMutex_, historyMutex_.
    // Hooks are called holding tickMutex_ only.
    std::mutex tickMutex_;
    mutable std::mutex stateMutex_;
    std::list<std::unique_ptr<Job>> pending_;
    std::list<std::unique_ptr<Job>> running_;
    std::optional<std::string> fault_;

    mutable std::mutex inboxMutex_;
    std::vector<std::unique_ptr<Job>> inbox_;
    bool closed_ = false;
    bool sealed_ = false;
    JobId nextId_ = 1;

    mutable std::mutex historyMutex_;
    std::vector<JobRecord> records_;
    std::size_t completed_ = 0;
    std::size_t failed_ = 0;
    std::size_t rejected_ = 0;

    std::shared_ptr<StatusReporter> reporter_;
    std::atomic<bool> loopRunning_{false};
    std::atomic<bool> stopRequested_{false};
    std::thread loopThread_;
    std::mutex loopMutex_;
    std::condition_variable loopDone_;
};

}
