/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/reporter.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace poolflow {
namespace unittest {

namespace {

Snapshot sampleSnapshot() {
    Snapshot snapshot;
    snapshot.mode = PoolMode::Static;
    snapshot.lifecycle = Lifecycle::Active;
    snapshot.capacity = Cost(4) << 30;
    snapshot.allocated = Cost(1) << 30;
    snapshot.running.push_back({7, Cost(1) << 30, "./simulate --steps 100", Clock::now()});
    snapshot.pendingCount = 3;
    snapshot.completed = 2;
    snapshot.taken = Clock::now();
    return snapshot;
}

std::vector<JobRecord> sampleRecords() {
    JobRecord done;
    done.id = 1;
    done.label = "sort big.txt";
    done.cost = 512;
    done.state = JobState::Completed;
    done.submitted = Clock::now() - std::chrono::seconds(5);
    done.started = done.submitted;
    done.finished = done.submitted + std::chrono::milliseconds(2500);
    done.exit = ExitStatus::exited(0);

    JobRecord rejected;
    rejected.id = 2;
    rejected.label = "too-big";
    rejected.cost = Cost(8) << 30;
    rejected.state = JobState::Rejected;
    rejected.submitted = Clock::now();
    rejected.finished = rejected.submitted;

    return {done, rejected};
}

}

TEST_CASE("Status tables show running jobs and the budget", "[reporter]") {
    std::ostringstream out;
    TableReporter reporter(out);

    reporter.report(sampleSnapshot());
    std::string text = out.str();

    REQUIRE(text.find("Pool status") != std::string::npos);
    REQUIRE(text.find("Jobs running: 1") != std::string::npos);
    REQUIRE(text.find("queued: 3") != std::string::npos);
    REQUIRE(text.find("./simulate --steps 100") != std::string::npos);
    REQUIRE(text.find("1.0 GiB of 4.0 GiB") != std::string::npos);
    REQUIRE(text.find("3.0 GiB available") != std::string::npos);
}

TEST_CASE("An unenforced budget is called out", "[reporter]") {
    Snapshot snapshot = sampleSnapshot();
    snapshot.enforced = false;
    snapshot.capacity = kUnbounded;

    std::ostringstream out;
    TableReporter(out).report(snapshot);

    REQUIRE(out.str().find("NOT enforced") != std::string::npos);
}

TEST_CASE("The final review lists every job", "[reporter]") {
    std::ostringstream out;
    TableReporter reporter(out);

    reporter.finished(sampleSnapshot(), sampleRecords());
    std::string text = out.str();

    REQUIRE(text.find("Pool review") != std::string::npos);
    REQUIRE(text.find("COMPLETED") != std::string::npos);
    REQUIRE(text.find("Released") != std::string::npos);
    REQUIRE(text.find("REJECTED") != std::string::npos);
    REQUIRE(text.find("Never allocated") != std::string::npos);
    REQUIRE(text.find("2.5s") != std::string::npos);
    REQUIRE(text.find("End of pool") != std::string::npos);
}

TEST_CASE("File reports replace the previous status", "[reporter]") {
    auto path = std::filesystem::temp_directory_path() / ("poolflow_status_" + std::to_string(getpid()) + ".txt");
    FileReporter reporter(path);

    auto read = [&path]() {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    };

    Snapshot first = sampleSnapshot();
    reporter.report(first);
    REQUIRE(read().find("queued: 3") != std::string::npos);

    Snapshot second = sampleSnapshot();
    second.pendingCount = 0;
    reporter.report(second);
    std::string text = read();
    REQUIRE(text.find("queued: 3") == std::string::npos);
    REQUIRE(text.find("queued: 0") != std::string::npos);

    reporter.finished(second, sampleRecords());
    REQUIRE(read().find("Pool review") != std::string::npos);

    std::filesystem::remove(path);
}

}
}
