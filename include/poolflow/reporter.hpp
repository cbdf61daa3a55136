/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "poolflow/job.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

struct RunningJob {
    JobId id = 0;
    Cost cost = 0;
    std::string label;
    Clock::time_point started;
};

// Consistent view of a pool, taken between ticks.
struct Snapshot {
    PoolMode mode = PoolMode::Dynamic;
    Lifecycle lifecycle = Lifecycle::Idle;
    bool closed = false;
    bool enforced = true;   // false: capacity is kUnbounded, budget not enforced
    bool faulted = false;

    std::size_t pendingCount = 0;
    std::vector<RunningJob> running;
    Cost allocated = 0;
    Cost capacity = 0;

    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t rejected = 0;
    std::uint64_t ticks = 0;
    Clock::time_point taken;
};

// Passive consumer of pool snapshots.
class StatusReporter {
public:
    virtual ~StatusReporter() = default;

    virtual void report(const Snapshot& snapshot) = 0;
    // Called once when the scheduling loop ends.
    virtual void finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) {
        (void)records;
        report(snapshot);
    }
};

// Plain-text tables, one block per report.
class TableReporter final : public StatusReporter {
public:
    explicit TableReporter(std::ostream& out) noexcept : out_(out) {}

    void report(const Snapshot& snapshot) override;
    void finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) override;

    void review(const std::vector<JobRecord>& records);

private:
    std::ostream& out_;
};

// Rewrites a file with the latest status on every report.
class FileReporter final : public StatusReporter {
public:
    explicit FileReporter(std::filesystem::path path);

    void report(const Snapshot& snapshot) override;
    void finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
