/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "fake_launcher.hpp"
#include "poolflow/pool.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <numeric>
#include <optional>
#include <thread>

namespace poolflow {
namespace unittest {

namespace {

struct TestPool {
    FakeLauncher* launcher = nullptr;
    std::unique_ptr<Pool> pool;
};

TestPool makePool(PoolMode mode, Cost capacity, std::vector<JobSpec> jobs = {}) {
    auto launcher = std::make_unique<FakeLauncher>();
    TestPool test;
    test.launcher = launcher.get();
    test.pool = std::make_unique<Pool>(mode, std::move(jobs),
                                       std::make_unique<BoundedAccountant>(capacity),
                                       std::move(launcher));
    return test;
}

Cost runningCost(const Snapshot& snapshot) {
    return std::accumulate(snapshot.running.begin(), snapshot.running.end(), Cost(0),
                           [](Cost sum, const RunningJob& job) { return sum + job.cost; });
}

class RecordingReporter final : public StatusReporter {
public:
    void report(const Snapshot& snapshot) override {
        ++reports;
        last = snapshot;
    }
    void finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) override {
        ++finishes;
        last = snapshot;
        reviewed = records.size();
    }

    int reports = 0;
    int finishes = 0;
    std::size_t reviewed = 0;
    Snapshot last;
};

}

TEST_CASE("Admission fills the budget in a single tick", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 1000);

    REQUIRE(test.pool->submit(fakeJob("A", 900)));
    REQUIRE(test.pool->submit(fakeJob("B", 100)));

    test.pool->tick();

    REQUIRE(test.launcher->launched == std::vector<std::string>{"A", "B"});
    auto snapshot = test.pool->snapshot();
    REQUIRE(snapshot.allocated == 1000);
    REQUIRE(snapshot.running.size() == 2);
    REQUIRE(snapshot.pendingCount == 0);
}

TEST_CASE("A job that does not fit does not block cheaper jobs behind it", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 1000);

    auto a = test.pool->submit(fakeJob("A", 600));
    auto b = test.pool->submit(fakeJob("B", 600));
    auto c = test.pool->submit(fakeJob("C", 300));
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);

    test.pool->tick();
    REQUIRE(test.pool->state(a.id) == JobState::Running);
    REQUIRE(test.pool->state(b.id) == JobState::Pending);
    REQUIRE(test.pool->state(c.id) == JobState::Running);
    REQUIRE(test.pool->snapshot().allocated == 900);

    SECTION("Budget released by an exit is reused in the same tick") {
        test.launcher->finish("A");
        test.pool->tick();

        REQUIRE(test.pool->state(a.id) == JobState::Completed);
        REQUIRE(test.pool->state(b.id) == JobState::Running);
        REQUIRE(test.pool->snapshot().allocated == 900);
    }

    SECTION("Nothing is admitted while the budget stays taken") {
        test.pool->tick();
        test.pool->tick();
        REQUIRE(test.pool->state(b.id) == JobState::Pending);
        REQUIRE(test.launcher->launched.size() == 2);
    }
}

TEST_CASE("Jobs larger than the whole capacity are rejected at submission", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 1000);

    auto result = test.pool->submit(fakeJob("huge", 2000));
    REQUIRE_FALSE(result);
    REQUIRE(result.error == SubmitError::CostExceedsCapacity);
    REQUIRE(result.id != 0);
    REQUIRE(test.pool->state(result.id) == JobState::Rejected);

    test.pool->tick();
    REQUIRE(test.launcher->launched.empty());

    auto snapshot = test.pool->snapshot();
    REQUIRE(snapshot.rejected == 1);
    REQUIRE(snapshot.pendingCount == 0);

    auto records = test.pool->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].state == JobState::Rejected);
    REQUIRE_FALSE(records[0].started);

    SECTION("A job exactly at capacity is accepted") {
        REQUIRE(test.pool->submit(fakeJob("exact", 1000)));
    }
}

TEST_CASE("A static pool runs its job list and terminates", "[pool]") {
    std::vector<JobSpec> jobs;
    jobs.push_back(fakeJob("A", 100));
    jobs.push_back(fakeJob("B", 100));
    auto test = makePool(PoolMode::Static, 100, std::move(jobs));

    REQUIRE(test.pool->lifecycle() == Lifecycle::Idle);

    REQUIRE(test.pool->tick() == Lifecycle::Active);
    REQUIRE(test.launcher->launched == std::vector<std::string>{"A"});

    // B waits for A's budget
    test.pool->tick();
    REQUIRE(test.launcher->launched.size() == 1);

    test.launcher->finish("A");
    REQUIRE(test.pool->tick() == Lifecycle::Active);
    REQUIRE(test.launcher->launched == std::vector<std::string>{"A", "B"});

    test.launcher->finish("B");
    REQUIRE(test.pool->tick() == Lifecycle::Terminated);

    auto snapshot = test.pool->snapshot();
    REQUIRE(snapshot.completed == 2);
    REQUIRE(snapshot.allocated == 0);

    // Terminated is final
    REQUIRE(test.pool->tick() == Lifecycle::Terminated);
}

TEST_CASE("A static pool takes no further jobs and cannot be ended", "[pool]") {
    std::vector<JobSpec> jobs;
    jobs.push_back(fakeJob("A", 10));
    auto test = makePool(PoolMode::Static, 100, std::move(jobs));

    auto result = test.pool->submit(fakeJob("late", 10));
    REQUIRE_FALSE(result);
    REQUIRE(result.error == SubmitError::NotAccepting);

    REQUIRE_FALSE(test.pool->end());
    REQUIRE_FALSE(test.pool->closed());
}

TEST_CASE("A static pool whose jobs were all rejected terminates at once", "[pool]") {
    std::vector<JobSpec> jobs;
    jobs.push_back(fakeJob("huge", 500));
    auto test = makePool(PoolMode::Static, 100, std::move(jobs));

    REQUIRE(test.pool->tick() == Lifecycle::Terminated);
    REQUIRE(test.pool->snapshot().rejected == 1);
}

TEST_CASE("Static pools refuse jobs without a command", "[pool]") {
    std::vector<JobSpec> jobs(1);
    jobs[0].cost = 10;
    REQUIRE_THROWS_AS(makePool(PoolMode::Static, 100, std::move(jobs)), std::invalid_argument);
}

TEST_CASE("A dynamic pool drains after end and then terminates", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    REQUIRE(test.pool->tick() == Lifecycle::Active);
    // An empty open pool keeps waiting for work
    REQUIRE(test.pool->tick() == Lifecycle::Active);

    auto a = test.pool->submit(fakeJob("A", 60));
    auto b = test.pool->submit(fakeJob("B", 60));
    test.pool->tick();

    REQUIRE(test.pool->end());
    REQUIRE(test.pool->lifecycle() == Lifecycle::Draining);
    REQUIRE(test.pool->closed());

    auto late = test.pool->submit(fakeJob("late", 1));
    REQUIRE_FALSE(late);
    REQUIRE(late.error == SubmitError::PoolClosed);

    // Already accepted work still runs
    REQUIRE(test.pool->tick() == Lifecycle::Draining);
    test.launcher->finish("A");
    REQUIRE(test.pool->tick() == Lifecycle::Draining);
    REQUIRE(test.pool->state(b.id) == JobState::Running);

    test.launcher->finish("B", ExitStatus::exited(1));
    REQUIRE(test.pool->tick() == Lifecycle::Terminated);
    REQUIRE(test.pool->state(a.id) == JobState::Completed);
    REQUIRE(test.pool->state(b.id) == JobState::Failed);

    REQUIRE(test.pool->end());
    REQUIRE(test.pool->submit(fakeJob("after", 1)).error == SubmitError::PoolClosed);
    REQUIRE(test.launcher->launched.size() == 2);
}

TEST_CASE("Ending an idle dynamic pool terminates it on the next tick", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    REQUIRE(test.pool->end());
    REQUIRE(test.pool->lifecycle() == Lifecycle::Draining);
    REQUIRE(test.pool->tick() == Lifecycle::Terminated);
}

TEST_CASE("Failed jobs give their budget back", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    SECTION("Non-zero exit") {
        auto id = test.pool->submit(fakeJob("A", 100)).id;
        test.pool->tick();
        test.launcher->finish("A", ExitStatus::exited(2));
        test.pool->tick();

        REQUIRE(test.pool->state(id) == JobState::Failed);
        REQUIRE(test.pool->snapshot().allocated == 0);
        auto records = test.pool->records();
        REQUIRE(records.back().exit->exitCode == 2);
    }

    SECTION("Launch failure") {
        test.launcher->failing.insert("broken");
        auto broken = test.pool->submit(fakeJob("broken", 100)).id;
        auto next = test.pool->submit(fakeJob("next", 100)).id;

        test.pool->tick();

        REQUIRE(test.pool->state(broken) == JobState::Failed);
        // The released budget went straight to the next job
        REQUIRE(test.pool->state(next) == JobState::Running);
        REQUIRE(test.pool->snapshot().allocated == 100);

        auto records = test.pool->records();
        REQUIRE(records.size() == 1);
        REQUIRE_FALSE(records[0].exit->launched);
        REQUIRE(records[0].exit->exitCode == 127);
    }
}

TEST_CASE("Hooks run once around each job", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    int pre = 0;
    int post = 0;
    std::optional<ExitStatus> seen;

    JobSpec spec = fakeJob("A", 50);
    spec.preHook = [&](const Job& job) {
        ++pre;
        REQUIRE(job.state == JobState::Pending);
    };
    spec.postHook = [&](const Job& job, const ExitStatus& status) {
        ++post;
        seen = status;
        REQUIRE(job.state == JobState::Completed);
    };
    REQUIRE(test.pool->submit(std::move(spec)));

    test.pool->tick();
    REQUIRE(pre == 1);
    REQUIRE(post == 0);

    test.pool->tick();
    test.launcher->finish("A", ExitStatus::exited(0));
    test.pool->tick();
    test.pool->tick();

    REQUIRE(pre == 1);
    REQUIRE(post == 1);
    REQUIRE(seen);
    REQUIRE(seen->ok());
}

TEST_CASE("A failing pre-processing hook fails the job", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    int post = 0;
    JobSpec spec = fakeJob("A", 50);
    spec.preHook = [](const Job&) { throw std::runtime_error("not today"); };
    spec.postHook = [&](const Job&, const ExitStatus& status) {
        ++post;
        REQUIRE_FALSE(status.launched);
    };
    auto id = test.pool->submit(std::move(spec)).id;

    test.pool->tick();

    REQUIRE(test.pool->state(id) == JobState::Failed);
    REQUIRE(test.launcher->launched.empty());
    REQUIRE(test.pool->snapshot().allocated == 0);
    REQUIRE(post == 1);
}

TEST_CASE("A failing post-processing hook does not change the outcome", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    JobSpec spec = fakeJob("A", 50);
    spec.postHook = [](const Job&, const ExitStatus&) { throw std::runtime_error("cleanup failed"); };
    auto id = test.pool->submit(std::move(spec)).id;

    test.pool->tick();
    test.launcher->finish("A");
    REQUIRE_NOTHROW(test.pool->tick());

    REQUIRE(test.pool->state(id) == JobState::Completed);
    REQUIRE(test.pool->snapshot().completed == 1);
}

TEST_CASE("Hooks that throw anything are contained", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    SECTION("Pre-processing hook") {
        int post = 0;
        std::optional<ExitStatus> seen;
        JobSpec spec = fakeJob("A", 60);
        spec.preHook = [](const Job&) { throw 42; };
        spec.postHook = [&](const Job&, const ExitStatus& status) {
            ++post;
            seen = status;
        };
        auto id = test.pool->submit(std::move(spec)).id;

        REQUIRE_NOTHROW(test.pool->tick());

        REQUIRE(test.pool->state(id) == JobState::Failed);
        REQUIRE(test.launcher->launched.empty());
        REQUIRE(post == 1);
        REQUIRE(seen);
        REQUIRE_FALSE(seen->launched);
        REQUIRE(seen->error == "pre-processing hook failed");
        auto snapshot = test.pool->snapshot();
        REQUIRE(snapshot.allocated == 0);
        REQUIRE(snapshot.running.empty());
        REQUIRE(snapshot.failed == 1);
        REQUIRE_FALSE(test.pool->fault());
    }

    SECTION("Post-processing hook") {
        JobSpec spec = fakeJob("A", 60);
        spec.postHook = [](const Job&, const ExitStatus&) { throw 42; };
        auto id = test.pool->submit(std::move(spec)).id;

        test.pool->tick();
        test.launcher->finish("A");
        REQUIRE_NOTHROW(test.pool->tick());

        REQUIRE(test.pool->state(id) == JobState::Completed);
        REQUIRE(test.pool->records().size() == 1);
        REQUIRE(test.pool->snapshot().allocated == 0);
    }
}

TEST_CASE("Hooks can query the pool", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);
    Pool* pool = test.pool.get();

    std::optional<JobState> before;
    Cost allocatedBefore = 0;
    std::optional<JobState> after;
    Cost allocatedAfter = 1;
    bool faulted = true;

    JobSpec spec = fakeJob("A", 50);
    spec.preHook = [&](const Job& job) {
        before = pool->state(job.id);
        allocatedBefore = pool->snapshot().allocated;
    };
    spec.postHook = [&](const Job& job, const ExitStatus&) {
        after = pool->state(job.id);
        allocatedAfter = pool->snapshot().allocated;
        faulted = pool->fault().has_value();
    };
    REQUIRE(pool->submit(std::move(spec)));

    pool->tick();
    // Admitted jobs hold their budget while the pre-hook runs
    REQUIRE(before == JobState::Running);
    REQUIRE(allocatedBefore == 50);

    test.launcher->finish("A");
    pool->tick();
    REQUIRE(after == JobState::Completed);
    REQUIRE(allocatedAfter == 0);
    REQUIRE_FALSE(faulted);
}

TEST_CASE("Finished jobs are released once and no longer polled", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);
    REQUIRE(test.pool->submit(fakeJob("A", 70)));
    REQUIRE(test.pool->submit(fakeJob("B", 30)));

    test.pool->tick();
    test.launcher->finish("A");
    test.pool->tick();

    auto& polled = test.launcher->processes.at("A")->polls;
    const int pollsAtExit = polled;
    for (int i = 0; i < 5; ++i) {
        test.pool->tick();
        REQUIRE(test.pool->snapshot().allocated == 30);
    }
    REQUIRE(polled == pollsAtExit);
    REQUIRE(test.pool->snapshot().completed == 1);
    REQUIRE(test.launcher->processes.at("B")->polls > pollsAtExit);
}

TEST_CASE("Pending jobs can be dropped", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);
    auto running = test.pool->submit(fakeJob("A", 100)).id;
    test.pool->tick();

    auto waiting = test.pool->submit(fakeJob("B", 50)).id;
    test.pool->tick();
    auto queued = test.pool->submit(fakeJob("C", 50)).id;

    REQUIRE(test.pool->clearPending() == 2);
    REQUIRE(test.pool->clearPending() == 0);

    REQUIRE(test.pool->state(running) == JobState::Running);
    REQUIRE(test.pool->state(waiting) == JobState::Rejected);
    REQUIRE(test.pool->state(queued) == JobState::Rejected);

    auto snapshot = test.pool->snapshot();
    REQUIRE(snapshot.pendingCount == 0);
    REQUIRE(snapshot.rejected == 2);
    REQUIRE(snapshot.allocated == 100);

    test.launcher->finish("A");
    test.pool->tick();
    REQUIRE(test.launcher->launched == std::vector<std::string>{"A"});
}

TEST_CASE("Hooks may submit follow-up jobs", "[pool][hooks]") {
    auto test = makePool(PoolMode::Dynamic, 100);
    Pool* pool = test.pool.get();

    JobSpec first = fakeJob("first", 100);
    first.postHook = [pool](const Job&, const ExitStatus&) {
        REQUIRE(pool->submit(fakeJob("second", 100)));
    };
    REQUIRE(pool->submit(std::move(first)));

    pool->tick();
    test.launcher->finish("first");
    pool->tick();
    REQUIRE(test.launcher->launched == std::vector<std::string>{"first"});

    pool->tick();
    REQUIRE(test.launcher->launched == std::vector<std::string>{"first", "second"});
}

TEST_CASE("The allocated budget always equals the cost of running jobs", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 1000);

    std::vector<std::pair<std::string, Cost>> jobs{
        {"a", 300}, {"b", 500}, {"c", 400}, {"d", 200}, {"e", 1000}, {"f", 100}};
    for (const auto& job : jobs) {
        REQUIRE(test.pool->submit(fakeJob(job.first, job.second)));
    }
    test.pool->end();

    int ticks = 0;
    while (test.pool->tick() != Lifecycle::Terminated) {
        auto snapshot = test.pool->snapshot();
        REQUIRE(snapshot.allocated == runningCost(snapshot));
        REQUIRE(snapshot.allocated <= snapshot.capacity);

        // Finish the oldest running job each round
        if (!snapshot.running.empty()) {
            test.launcher->finish(snapshot.running.front().label);
        }
        REQUIRE(++ticks < 50);
    }

    auto snapshot = test.pool->snapshot();
    REQUIRE(snapshot.completed == jobs.size());
    REQUIRE(snapshot.allocated == 0);
}

TEST_CASE("Job ids are unique and increasing", "[pool]") {
    auto test = makePool(PoolMode::Dynamic, 100);

    auto first = test.pool->submit(fakeJob("a", 1));
    auto rejected = test.pool->submit(fakeJob("b", 1000));
    auto third = test.pool->submit(fakeJob("c", 1));

    REQUIRE(first.id < rejected.id);
    REQUIRE(rejected.id < third.id);
    REQUIRE_FALSE(test.pool->state(9999));
}

TEST_CASE("Corrupted bookkeeping faults the pool", "[pool]") {
    auto launcher = std::make_unique<FakeLauncher>();
    auto accountant = std::make_unique<LeakyAccountant>(100);
    FakeLauncher* fake = launcher.get();
    LeakyAccountant* leaky = accountant.get();
    Pool pool(PoolMode::Dynamic, {}, std::move(accountant), std::move(launcher));

    REQUIRE(pool.submit(fakeJob("A", 40)));
    pool.tick();

    leaky->forget = true;
    fake->finish("A");

    REQUIRE_THROWS_AS(pool.tick(), AccountingError);
    REQUIRE(pool.fault());
    REQUIRE(pool.snapshot().faulted);

    // Every later tick refuses to schedule
    REQUIRE_THROWS_AS(pool.tick(), AccountingError);
}

TEST_CASE("An unbounded pool admits everything and says so", "[pool]") {
    auto launcher = std::make_unique<FakeLauncher>();
    FakeLauncher* fake = launcher.get();
    Pool pool(PoolMode::Dynamic, {}, std::make_unique<UnboundedAccountant>(), std::move(launcher));

    REQUIRE(pool.submit(fakeJob("A", Cost(1) << 50)));
    REQUIRE(pool.submit(fakeJob("B", Cost(1) << 50)));
    pool.tick();

    REQUIRE(fake->launched.size() == 2);
    auto snapshot = pool.snapshot();
    REQUIRE_FALSE(snapshot.enforced);
    REQUIRE(snapshot.capacity == kUnbounded);
    REQUIRE(snapshot.allocated == (Cost(1) << 51));
}

TEST_CASE("Pools need an accountant and a launcher", "[pool]") {
    REQUIRE_THROWS_AS(Pool(PoolMode::Dynamic, {}, nullptr, std::make_unique<FakeLauncher>()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Pool(PoolMode::Dynamic, {}, std::make_unique<BoundedAccountant>(1), nullptr),
                      std::invalid_argument);
}

TEST_CASE("The background loop schedules within the budget", "[pool][loop]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    auto work = [&active, &peak]() {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        --active;
        return 0;
    };

    std::vector<JobSpec> jobs;
    for (int i = 0; i < 6; ++i) {
        JobSpec spec;
        spec.cost = 40;
        spec.command = Command::call(work, "job" + std::to_string(i));
        jobs.push_back(std::move(spec));
    }

    PoolConfig config;
    config.tickInterval = std::chrono::milliseconds(5);
    config.refreshInterval = std::chrono::milliseconds(20);
    Pool pool(PoolMode::Static, std::move(jobs), std::make_unique<BoundedAccountant>(100),
              std::make_unique<SystemLauncher>(), config);

    auto reporter = std::make_shared<RecordingReporter>();
    pool.setReporter(reporter);

    REQUIRE(pool.start());
    REQUIRE(pool.isRunning());
    REQUIRE(pool.waitFor(std::chrono::seconds(20)));
    REQUIRE(pool.wait() == Lifecycle::Terminated);

    REQUIRE(peak.load() <= 2);
    REQUIRE(peak.load() >= 1);
    REQUIRE_FALSE(pool.isRunning());

    REQUIRE(reporter->finishes == 1);
    REQUIRE(reporter->reviewed == 6);
    REQUIRE(reporter->last.completed == 6);
    REQUIRE(reporter->last.lifecycle == Lifecycle::Terminated);

    // A terminated pool cannot be restarted
    REQUIRE_FALSE(pool.start());
}

TEST_CASE("The background loop takes submissions until ended", "[pool][loop]") {
    PoolConfig config;
    config.tickInterval = std::chrono::milliseconds(5);
    Pool pool(PoolMode::Dynamic, {}, std::make_unique<BoundedAccountant>(100),
              std::make_unique<SystemLauncher>(), config);

    REQUIRE(pool.start());

    std::atomic<int> ran{0};
    for (int i = 0; i < 3; ++i) {
        JobSpec spec;
        spec.cost = 100;
        spec.command = Command::call([&ran] { ++ran; return 0; });
        REQUIRE(pool.submit(std::move(spec)));
    }

    // Still open: the loop keeps waiting for work
    REQUIRE_FALSE(pool.waitFor(std::chrono::milliseconds(100)));

    REQUIRE(pool.end());
    REQUIRE(pool.waitFor(std::chrono::seconds(20)));
    REQUIRE(pool.lifecycle() == Lifecycle::Terminated);
    REQUIRE(ran.load() == 3);
}

TEST_CASE("Stopping the loop leaves the pool as it was", "[pool][loop]") {
    PoolConfig config;
    config.tickInterval = std::chrono::milliseconds(5);
    Pool pool(PoolMode::Dynamic, {}, std::make_unique<BoundedAccountant>(100),
              std::make_unique<SystemLauncher>(), config);

    REQUIRE(pool.start());
    REQUIRE_FALSE(pool.start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (pool.snapshot().ticks == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pool.stop();

    REQUIRE_FALSE(pool.isRunning());
    REQUIRE(pool.lifecycle() == Lifecycle::Active);
}

}
}
