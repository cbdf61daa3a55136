/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/pool.hpp"
#include "poolflow/logger.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>

namespace poolflow {

namespace {
std::string describeJob(const Job& job) {
    return "job " + std::to_string(job.id) + " (" + job.label + ")";
}
}

Pool::Pool(PoolMode mode,
           std::vector<JobSpec> jobs,
           std::unique_ptr<ResourceAccountant> accountant,
           std::unique_ptr<ProcessLauncher> launcher,
           const PoolConfig& config)
    : mode_(mode),
      accountant_(std::move(accountant)),
      launcher_(std::move(launcher)),
      tickInterval_(config.tickInterval),
      refreshInterval_(config.refreshInterval) {
    if (!accountant_ || !launcher_) {
        throw std::invalid_argument("Pool requires an accountant and a launcher");
    }

    LOG_DEBUG(std::string("Pool created - mode: ") + toString(mode_) +
              ", capacity: " + formatSize(accountant_->capacity()) +
              ", jobs: " + std::to_string(jobs.size()));
    if (!accountant_->enforcing()) {
        LOG_WARN("Pool runs with an unbounded memory budget");
    }

    std::lock_guard<std::mutex> lock(inboxMutex_);
    for (auto& spec : jobs) {
        if (!spec.command.valid()) {
            throw std::invalid_argument("Job " + std::to_string(nextId_) + " has no valid command");
        }
        (void)enqueueLocked(std::move(spec));
    }
    // The job list of a static pool is fixed from here on.
    sealed_ = mode_ == PoolMode::Static;
}

Pool::~Pool() {
    stop();
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!running_.empty()) {
        LOG_WARN("Pool destroyed with " + std::to_string(running_.size()) + " job(s) still running");
    }
}

std::unique_ptr<Pool> Pool::create(PoolMode mode, const PoolConfig& config, std::vector<JobSpec> jobs) {
    return std::make_unique<Pool>(mode, std::move(jobs),
                                  makeAccountant(config.capacity),
                                  std::make_unique<SystemLauncher>(config.limits),
                                  config);
}

SubmitResult Pool::submit(JobSpec spec) {
    if (!spec.command.valid()) {
        LOG_DEBUG("Invalid command submitted");
        return {false, 0, SubmitError::InvalidCommand, "Command must be a program or a callable"};
    }

    std::lock_guard<std::mutex> lock(inboxMutex_);
    if (sealed_) {
        LOG_DEBUG("Submission refused by static pool");
        return {false, 0, SubmitError::NotAccepting, "Static pools take their jobs at construction"};
    }
    if (closed_) {
        LOG_DEBUG("Submission refused by closed pool");
        return {false, 0, SubmitError::PoolClosed, "Pool is closed to new jobs"};
    }
    return enqueueLocked(std::move(spec));
}

SubmitResult Pool::enqueueLocked(JobSpec spec) {
    auto job = std::make_unique<Job>(nextId_++, std::move(spec));
    const JobId id = job->id;

    if (!accountant_->admissible(job->cost)) {
        // Can never fit; keeping it queued would block nothing but wait forever.
        job->state = JobState::Rejected;
        job->finished = Clock::now();
        std::string message = "Cost " + formatSize(job->cost) + " exceeds capacity " +
                              formatSize(accountant_->capacity());
        LOG_WARN("Rejected " + describeJob(*job) + ": " + message);
        {
            std::lock_guard<std::mutex> lock(historyMutex_);
            records_.push_back(job->record());
            ++rejected_;
        }
        return {false, id, SubmitError::CostExceedsCapacity, message};
    }

    LOG_DEBUG("Queued " + describeJob(*job) + " with cost " + formatSize(job->cost));
    inbox_.push_back(std::move(job));
    return {true, id, SubmitError::None, ""};
}

bool Pool::end() {
    if (mode_ != PoolMode::Dynamic) {
        LOG_WARN("end() ignored: static pools terminate on their own");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        if (closed_) {
            return true;
        }
        closed_ = true;
    }

    Lifecycle current = lifecycle_.load();
    while (current != Lifecycle::Terminated && current != Lifecycle::Draining) {
        if (lifecycle_.compare_exchange_weak(current, Lifecycle::Draining)) {
            break;
        }
    }

    LOG_INFO("Pool closed to new jobs; draining");
    return true;
}

Lifecycle Pool::tick() {
    std::lock_guard<std::mutex> tickLock(tickMutex_);

    bool closed = false;
    std::vector<Finished> finished;
    std::vector<Job*> admitted;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (fault_) {
            throw AccountingError(*fault_);
        }

        Lifecycle current = lifecycle_.load();
        if (current == Lifecycle::Terminated) {
            return current;
        }
        if (current == Lifecycle::Idle && lifecycle_.compare_exchange_strong(current, Lifecycle::Active)) {
            LOG_DEBUG(std::string("Pool active (") + toString(mode_) + ")");
        }

        try {
            closed = drainInbox();
            // Monitor first so that budget freed this tick can be used by admission.
            finished = monitor();
            admitted = admit();
        } catch (const AccountingError& e) {
            fault_ = e.what();
            LOG_ERROR(std::string("Accounting fault, scheduling halted: ") + e.what());
            throw;
        }
    }

    // Hooks run without stateMutex_ so that they can query the pool.
    for (auto& done : finished) {
        runPostHook(*done.job, done.status);
    }

    try {
        while (!admitted.empty()) {
            bool released = false;
            for (Job* job : admitted) {
                released |= !launch(*job);
            }
            if (!released) {
                break;
            }
            // A failed launch gave its budget back; offer it to the jobs still waiting.
            std::lock_guard<std::mutex> lock(stateMutex_);
            admitted = admit();
        }
    } catch (const AccountingError& e) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        fault_ = e.what();
        LOG_ERROR(std::string("Accounting fault, scheduling halted: ") + e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    ++ticks_;
    updateLifecycle(closed);
    return lifecycle_.load();
}

bool Pool::drainInbox() {
    std::lock_guard<std::mutex> lock(inboxMutex_);
    for (auto& job : inbox_) {
        pending_.push_back(std::move(job));
    }
    inbox_.clear();
    return closed_;
}

std::vector<Pool::Finished> Pool::monitor() {
    std::vector<Finished> finished;
    for (auto it = running_.begin(); it != running_.end();) {
        Job& job = **it;
        if (!job.process) {
            ++it;
            continue;
        }

        std::optional<ExitStatus> status;
        try {
            status = job.process->poll();
        } catch (const std::exception& e) {
            status = ExitStatus::failure(std::string("poll failed: ") + e.what());
        } catch (...) {
            status = ExitStatus::failure("poll failed");
        }
        if (!status) {
            ++it;
            continue;
        }

        accountant_->release(job.cost);
        std::unique_ptr<Job> done = std::move(*it);
        it = running_.erase(it);
        done->process.reset();
        settle(*done, *status);
        finished.push_back({std::move(done), *status});
    }
    return finished;
}

std::vector<Job*> Pool::admit() {
    // First fit: a job that does not fit never blocks cheaper jobs behind it.
    std::vector<Job*> admitted;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!accountant_->reserve((*it)->cost)) {
            ++it;
            continue;
        }
        Job& job = **it;
        LOG_INFO("Admitting " + describeJob(job) + " - cost " + formatSize(job.cost) +
                 ", allocated " + formatSize(accountant_->allocated()) + " of " +
                 formatSize(accountant_->capacity()));
        // Counted as running from here on, so that the budget always matches.
        running_.push_back(std::move(*it));
        it = pending_.erase(it);
        admitted.push_back(&job);
    }
    return admitted;
}

bool Pool::launch(Job& job) {
    std::string failure;
    if (job.preHook) {
        try {
            job.preHook(job);
        } catch (const std::exception& e) {
            failure = std::string("pre-processing hook failed: ") + e.what();
        } catch (...) {
            failure = "pre-processing hook failed";
        }
    }

    std::unique_ptr<ProcessHandle> process;
    if (failure.empty()) {
        try {
            process = launcher_->launch(job.command, job.cost);
            if (!process) {
                failure = "launcher returned no process";
            }
        } catch (const std::exception& e) {
            failure = *e.what() ? e.what() : "launch failed";
        } catch (...) {
            failure = "unknown launch error";
        }
    }

    std::unique_ptr<Job> failed;
    ExitStatus status;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (failure.empty()) {
            job.process = std::move(process);
            job.state = JobState::Running;
            job.started = Clock::now();
            LOG_DEBUG("Started " + describeJob(job) + " as " + job.process->describe());
            return true;
        }

        auto it = std::find_if(running_.begin(), running_.end(),
                               [&job](const std::unique_ptr<Job>& candidate) { return candidate.get() == &job; });
        failed = std::move(*it);
        running_.erase(it);
        accountant_->release(failed->cost);
        LOG_WARN("Launch of " + describeJob(job) + " failed: " + failure);
        status = ExitStatus::launchFailure(failure);
        settle(*failed, status);
    }

    runPostHook(*failed, status);
    return false;
}

void Pool::settle(Job& job, const ExitStatus& status) {
    job.exit = status;
    job.finished = Clock::now();
    job.state = status.ok() ? JobState::Completed : JobState::Failed;

    if (job.state == JobState::Completed) {
        LOG_INFO("Completed " + describeJob(job));
    } else {
        LOG_WARN("Failed " + describeJob(job) + ": " + status.describe());
    }
    retire(job);
}

void Pool::runPostHook(const Job& job, const ExitStatus& status) {
    if (!job.postHook) {
        return;
    }
    try {
        job.postHook(job, status);
    } catch (const std::exception& e) {
        LOG_ERROR("Post-processing hook of " + describeJob(job) + " failed: " + e.what());
    } catch (...) {
        LOG_ERROR("Post-processing hook of " + describeJob(job) + " failed");
    }
}

void Pool::retire(const Job& job) {
    std::lock_guard<std::mutex> lock(historyMutex_);
    records_.push_back(job.record());
    if (job.state == JobState::Completed) {
        ++completed_;
    } else {
        ++failed_;
    }
}

std::size_t Pool::clearPending() {
    std::vector<std::unique_ptr<Job>> dropped;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        std::lock_guard<std::mutex> inboxLock(inboxMutex_);
        for (auto& job : pending_) {
            dropped.push_back(std::move(job));
        }
        pending_.clear();
        for (auto& job : inbox_) {
            dropped.push_back(std::move(job));
        }
        inbox_.clear();

        std::lock_guard<std::mutex> historyLock(historyMutex_);
        for (auto& job : dropped) {
            job->state = JobState::Rejected;
            job->finished = Clock::now();
            records_.push_back(job->record());
            ++rejected_;
        }
    }

    if (!dropped.empty()) {
        LOG_INFO("Dropped " + std::to_string(dropped.size()) + " pending job(s)");
    }
    return dropped.size();
}

void Pool::updateLifecycle(bool closed) {
    if (!pending_.empty() || !running_.empty()) {
        return;
    }
    if (mode_ == PoolMode::Dynamic && !closed) {
        return;
    }

    Lifecycle previous = lifecycle_.exchange(Lifecycle::Terminated);
    if (previous != Lifecycle::Terminated) {
        LOG_INFO(std::string("Pool terminated (") + toString(mode_) + ")");
    }
}

Snapshot Pool::snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);

    Snapshot snap;
    snap.mode = mode_;
    snap.lifecycle = lifecycle_.load();
    snap.enforced = accountant_->enforcing();
    snap.faulted = fault_.has_value();
    snap.allocated = accountant_->allocated();
    snap.capacity = accountant_->capacity();
    snap.ticks = ticks_.load();
    snap.taken = Clock::now();

    snap.running.reserve(running_.size());
    for (const auto& job : running_) {
        snap.running.push_back({job->id, job->cost, job->label, job->started.value_or(job->submitted)});
    }

    {
        std::lock_guard<std::mutex> inboxLock(inboxMutex_);
        snap.closed = closed_;
        snap.pendingCount = pending_.size() + inbox_.size();
    }
    {
        std::lock_guard<std::mutex> historyLock(historyMutex_);
        snap.completed = completed_;
        snap.failed = failed_;
        snap.rejected = rejected_;
    }
    return snap;
}

std::vector<JobRecord> Pool::records() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return records_;
}

std::optional<JobState> Pool::state(JobId id) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto matches = [id](const std::unique_ptr<Job>& job) { return job->id == id; };

    if (std::any_of(running_.begin(), running_.end(), matches)) {
        return JobState::Running;
    }
    if (std::any_of(pending_.begin(), pending_.end(), matches)) {
        return JobState::Pending;
    }
    {
        std::lock_guard<std::mutex> inboxLock(inboxMutex_);
        if (std::any_of(inbox_.begin(), inbox_.end(), matches)) {
            return JobState::Pending;
        }
    }
    std::lock_guard<std::mutex> historyLock(historyMutex_);
    for (const auto& rec : records_) {
        if (rec.id == id) {
            return rec.state;
        }
    }
    return std::nullopt;
}

bool Pool::closed() const {
    std::lock_guard<std::mutex> lock(inboxMutex_);
    return closed_;
}

std::optional<std::string> Pool::fault() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return fault_;
}

void Pool::setReporter(std::shared_ptr<StatusReporter> reporter) {
    if (loopRunning_.load()) {
        LOG_WARN("Reporter cannot be changed while the scheduling loop runs");
        return;
    }
    reporter_ = std::move(reporter);
}

bool Pool::start() {
    if (loopRunning_.load()) {
        LOG_WARN("Scheduling loop already running");
        return false;
    }
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
    if (lifecycle_.load() == Lifecycle::Terminated) {
        LOG_WARN("Pool already terminated");
        return false;
    }

    stopRequested_.store(false);
    loopRunning_.store(true);
    try {
        loopThread_ = std::thread(&Pool::runLoop, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start scheduling loop: " + std::string(e.what()));
        loopRunning_.store(false);
        return false;
    }

    LOG_DEBUG("Scheduling loop started, tick " + std::to_string(tickInterval_.count()) + " ms");
    return true;
}

void Pool::stop() noexcept {
    stopRequested_.store(true);
    if (loopThread_.joinable() && loopThread_.get_id() != std::this_thread::get_id()) {
        loopThread_.join();
    }
}

Lifecycle Pool::wait() {
    if (loopThread_.joinable() && loopThread_.get_id() != std::this_thread::get_id()) {
        loopThread_.join();
    }
    return lifecycle_.load();
}

bool Pool::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(loopMutex_);
    return loopDone_.wait_for(lock, timeout, [this] { return !loopRunning_.load(); });
}

void Pool::runLoop() {
    setThreadName("Scheduler");

    const auto slice = std::min(tickInterval_, std::chrono::milliseconds(100));
    auto nextReport = std::chrono::steady_clock::now();

    while (!stopRequested_.load()) {
        Lifecycle current = Lifecycle::Idle;
        try {
            current = tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduling loop stopped: " + std::string(e.what()));
            break;
        } catch (...) {
            LOG_ERROR("Scheduling loop stopped: unknown error");
            break;
        }

        if (reporter_ && std::chrono::steady_clock::now() >= nextReport) {
            emitStatus(false);
            nextReport = std::chrono::steady_clock::now() + refreshInterval_;
        }

        if (current == Lifecycle::Terminated) {
            break;
        }

        auto sleepEnd = std::chrono::steady_clock::now() + tickInterval_;
        while (std::chrono::steady_clock::now() < sleepEnd && !stopRequested_.load()) {
            std::this_thread::sleep_for(slice);
        }
    }

    if (reporter_) {
        emitStatus(true);
    }

    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        loopRunning_.store(false);
    }
    loopDone_.notify_all();
    LOG_DEBUG("Scheduling loop stopped");
}

void Pool::emitStatus(bool final) noexcept {
    try {
        if (final) {
            reporter_->finished(snapshot(), records());
        } else {
            reporter_->report(snapshot());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Status reporter failed: " + std::string(e.what()));
    }
}

}
