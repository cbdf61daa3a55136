/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "temp_workspace.hpp"
#include "poolflow/flow.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/processor.hpp"
#include "poolflow/scanner.hpp"
#include "poolflow/work.hpp"
#include <fstream>

namespace poolflow {
namespace unittest {

namespace fs = std::filesystem;
using std::string;
using std::vector;

namespace {
string slurp(const fs::path& path) {
    std::ifstream file(path);
    return string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}
}

TEST_CASE("Submitting writes a published ticket", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());

    REQUIRE(layout::exists(ws.path()));

    auto result = work.submit(2048, {"sort", "-n", "big file.txt"}, "nightly sort");
    REQUIRE(result);
    REQUIRE_FALSE(result.id.empty());

    auto dir = layout::ticketPath(ws.path(), layout::kReady, result.id);
    REQUIRE(fs::is_directory(dir));
    REQUIRE(fs::is_empty(ws.path() / layout::kWriting));

    auto ticket = Processor::readTicket(dir);
    REQUIRE(ticket);
    REQUIRE(ticket->cost == 2048);
    REQUIRE(ticket->argv == vector<string>{"sort", "-n", "big file.txt"});
    REQUIRE(ticket->label == "nightly sort");

    auto second = work.submit(1, {"true"});
    REQUIRE(second);
    REQUIRE(second.id != result.id);
}

TEST_CASE("Bad submissions are refused", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());

    SECTION("Empty command") {
        REQUIRE(work.submit(1, {}).error == SubmitError::InvalidCommand);
        REQUIRE(work.submit(1, {""}).error == SubmitError::InvalidCommand);
    }

    SECTION("NUL inside an argument") {
        REQUIRE(work.submit(1, {"echo", string("a\0b", 3)}).error == SubmitError::InvalidCommand);
    }

    SECTION("Oversized command") {
        work.setMaxSize(16);
        REQUIRE(work.submit(1, {"echo", string(32, 'x')}).error == SubmitError::InvalidSize);
    }

    REQUIRE(fs::is_empty(ws.path() / layout::kReady));
}

TEST_CASE("Submitting needs an existing workspace unless asked to create it", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path(), false);

    auto result = work.submit(1, {"true"});
    REQUIRE_FALSE(result);
    REQUIRE(result.error == SubmitError::WorkspaceError);
    REQUIRE_FALSE(fs::exists(ws.path()));
}

TEST_CASE("The scanner lists complete tickets oldest first", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());
    Scanner scanner(ws.path());

    REQUIRE(scanner.scan().empty());

    auto first = work.submit(1, {"true"}).id;
    auto second = work.submit(1, {"false"}).id;

    // A ticket without an argv file is ignored
    fs::create_directories(ws.path() / layout::kReady / "0_incomplete");

    auto tickets = scanner.scan();
    REQUIRE(tickets == vector<TicketId>{first, second});
    REQUIRE(scanner.readyCount() == 2);
}

TEST_CASE("Claiming turns a ticket into a pool job", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());
    Processor processor(ws.path());
    Flow flow(ws.path());

    auto id = work.submit(4096, {"/bin/echo", "hello"}, "greeting").id;
    REQUIRE(flow.status(id) == TicketStatus::Queued);

    auto spec = processor.claim(id);
    REQUIRE(spec);
    REQUIRE(spec->cost == 4096);
    REQUIRE(spec->label == "greeting");
    REQUIRE(spec->command.argv == vector<string>{"/bin/echo", "hello"});
    REQUIRE(spec->command.outputPath == layout::ticketPath(ws.path(), layout::kProcessing, id) / layout::kOutputLog);
    REQUIRE(spec->postHook);
    REQUIRE(flow.status(id) == TicketStatus::Running);

    // A ticket can only be claimed once
    REQUIRE_FALSE(processor.claim(id));

    SECTION("The post-processing hook finalizes the ticket") {
        Job job(1, std::move(*spec));
        job.postHook(job, ExitStatus::exited(0));

        REQUIRE(flow.status(id) == TicketStatus::Done);
        auto info = flow.get(id);
        REQUIRE(info);
        REQUIRE(info->exit == "exit 0");
        REQUIRE(info->error.empty());
    }

    SECTION("Failures keep the exit status and the reason") {
        REQUIRE(processor.finalize(id, ExitStatus::exited(3)));

        REQUIRE(flow.status(id) == TicketStatus::Failed);
        auto info = flow.get(id);
        REQUIRE(info);
        REQUIRE(info->exit == "exit 3");
        REQUIRE(info->error == "exit 3\n");
        REQUIRE(flow.error(id));
    }

    SECTION("Rejected tickets record why") {
        REQUIRE(processor.reject(id, "cost exceeds capacity"));

        REQUIRE(flow.status(id) == TicketStatus::Failed);
        REQUIRE(flow.get(id)->error == "cost exceeds capacity\n");
        REQUIRE(flow.get(id)->exit.empty());
    }
}

TEST_CASE("Unreadable tickets are failed at claim time", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());
    Processor processor(ws.path());
    Flow flow(ws.path());

    auto id = work.submit(1, {"true"}).id;
    {
        std::ofstream cost(layout::ticketPath(ws.path(), layout::kReady, id) / layout::kCostFile);
        cost << "plenty\n";
    }

    REQUIRE_FALSE(processor.claim(id));
    REQUIRE(flow.status(id) == TicketStatus::Failed);
    REQUIRE(flow.error(id)->find("Unreadable") != string::npos);
}

TEST_CASE("Tickets left in processing are failed", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());
    Processor processor(ws.path());
    Flow flow(ws.path());

    auto id = work.submit(1, {"true"}).id;
    REQUIRE(processor.claim(id));

    REQUIRE(processor.failOrphans() == 1);
    REQUIRE(flow.status(id) == TicketStatus::Failed);
    REQUIRE(processor.failOrphans() == 0);
}

TEST_CASE("Flow reports outcomes newest first", "[workspace]") {
    TempWorkspace ws;
    Work work(ws.path());
    Processor processor(ws.path());
    Flow flow(ws.path());

    REQUIRE_FALSE(flow.latest());
    REQUIRE(flow.list().empty());
    REQUIRE(flow.status("nope") == TicketStatus::Missing);
    REQUIRE_FALSE(flow.get("nope"));
    REQUIRE_FALSE(flow.exists("nope"));

    auto pending = work.submit(1, {"true"}).id;
    auto done = work.submit(1, {"true"}).id;
    REQUIRE(processor.claim(done));
    REQUIRE(processor.finalize(done, ExitStatus::exited(0)));

    {
        std::ofstream log(layout::ticketPath(ws.path(), layout::kOutput, done) / layout::kOutputLog);
        log << "42\n";
    }
    REQUIRE(flow.output(done) == string("42\n"));
    REQUIRE_FALSE(flow.output(pending));

    auto tickets = flow.list();
    REQUIRE(tickets.size() == 1);
    REQUIRE(tickets[0].id == done);
    REQUIRE(flow.latest()->id == done);
    REQUIRE(flow.get(pending)->status == TicketStatus::Queued);

    REQUIRE(slurp(layout::ticketPath(ws.path(), layout::kOutput, done) / layout::kExitFile) == "exit 0\n");
}

}
}
