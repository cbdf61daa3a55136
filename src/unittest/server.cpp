/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "temp_workspace.hpp"
#include "poolflow/flow.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/pool.hpp"
#include "poolflow/server.hpp"
#include "poolflow/work.hpp"
#include <chrono>
#include <thread>

namespace poolflow {
namespace unittest {

namespace {
TicketStatus waitFinished(const Flow& flow, const TicketId& id,
                          std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    TicketStatus status = flow.status(id);
    while (status != TicketStatus::Done && status != TicketStatus::Failed &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        status = flow.status(id);
    }
    return status;
}

PoolConfig testConfig(const TempWorkspace& ws) {
    PoolConfig config;
    config.capacity = Cost(64) << 20;
    config.tickInterval = std::chrono::milliseconds(20);
    config.refreshInterval = std::chrono::milliseconds(200);
    config.statusFile = ws.path() / "status.txt";
    return config;
}
}

TEST_CASE("The daemon runs submitted tickets", "[server]") {
    TempWorkspace ws;
    Server server(ws.path(), testConfig(ws));
    REQUIRE(server.start());
    REQUIRE(server.isRunning());
    REQUIRE_FALSE(server.start());

    Work work(ws.path(), false);
    Flow flow(ws.path());

    SECTION("Successful program") {
        auto id = work.submit(1024, {"/bin/sh", "-c", "echo hello"}).id;
        REQUIRE(waitFinished(flow, id) == TicketStatus::Done);
        REQUIRE(flow.get(id)->exit == "exit 0");
        REQUIRE(flow.output(id) == std::string("hello\n"));
    }

    SECTION("Failing program") {
        auto id = work.submit(1024, {"/bin/sh", "-c", "exit 3"}).id;
        REQUIRE(waitFinished(flow, id) == TicketStatus::Failed);
        REQUIRE(flow.get(id)->exit == "exit 3");
    }

    SECTION("Program that does not exist") {
        auto id = work.submit(1024, {"/nonexistent/poolflow-program"}).id;
        REQUIRE(waitFinished(flow, id) == TicketStatus::Failed);
        REQUIRE(flow.error(id)->find("launch failed") != std::string::npos);
    }

    SECTION("Job larger than the budget") {
        auto id = work.submit(Cost(1) << 30, {"/bin/sh", "-c", "exit 0"}).id;
        REQUIRE(waitFinished(flow, id) == TicketStatus::Failed);
        REQUIRE(flow.error(id)->find("cost exceeds capacity") != std::string::npos);
    }

    server.shutdown();
    REQUIRE_FALSE(server.isRunning());
    REQUIRE(server.pool() == nullptr);
}

TEST_CASE("The daemon waits for running jobs on shutdown", "[server]") {
    TempWorkspace ws;
    Server server(ws.path(), testConfig(ws));
    REQUIRE(server.start());

    Work work(ws.path(), false);
    Flow flow(ws.path());

    auto id = work.submit(1024, {"/bin/sh", "-c", "sleep 0.3"}).id;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (flow.status(id) != TicketStatus::Running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(flow.status(id) == TicketStatus::Running);

    server.shutdown();
    REQUIRE(flow.status(id) == TicketStatus::Done);
}

TEST_CASE("The daemon fails tickets orphaned by a previous run", "[server]") {
    TempWorkspace ws;
    REQUIRE(layout::create(ws.path()));
    std::filesystem::create_directories(layout::ticketPath(ws.path(), layout::kProcessing, "1_1_0"));

    Server server(ws.path(), testConfig(ws));
    REQUIRE(server.start());

    Flow flow(ws.path());
    REQUIRE(flow.status("1_1_0") == TicketStatus::Failed);
    REQUIRE(flow.error("1_1_0"));

    server.shutdown();
}

}
}
