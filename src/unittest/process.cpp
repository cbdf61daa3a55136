/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/process.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <memory>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace poolflow {
namespace unittest {

namespace {
std::optional<ExitStatus> waitExit(ProcessHandle& handle,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto status = handle.poll()) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return std::nullopt;
}
}

TEST_CASE("Exit statuses describe themselves", "[process]") {
    REQUIRE(ExitStatus::exited(0).ok());
    REQUIRE(ExitStatus::exited(0).describe() == "exit 0");

    auto failed = ExitStatus::exited(3);
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.describe() == "exit 3");

    auto killed = ExitStatus::signaled(SIGKILL);
    REQUIRE_FALSE(killed.ok());
    REQUIRE(killed.exitCode == 128 + SIGKILL);
    REQUIRE(killed.describe().find("signal 9") != std::string::npos);

    auto notStarted = ExitStatus::launchFailure("no such file");
    REQUIRE_FALSE(notStarted.launched);
    REQUIRE_FALSE(notStarted.ok());
    REQUIRE(notStarted.describe() == "launch failed: no such file");
}

TEST_CASE("Commands hold either a program or a callable", "[process]") {
    REQUIRE(Command::exec({"sort", "-n"}).valid());
    REQUIRE(Command::exec({"sort", "-n"}).label() == "sort -n");
    REQUIRE(Command::call([] { return 0; }, "inline").label() == "inline");

    REQUIRE_FALSE(Command().valid());
    Command both = Command::exec({"true"});
    both.callable = [] { return 0; };
    REQUIRE_FALSE(both.valid());
}

TEST_CASE("Programs run to completion and report their exit code", "[process]") {
    SystemLauncher launcher;

    SECTION("Success") {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "exit 0"}), 0);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE(status->ok());
        // The status sticks once reported
        REQUIRE(handle->poll()->ok());
    }

    SECTION("Non-zero exit") {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "exit 3"}), 0);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE(status->exitCode == 3);
        REQUIRE_FALSE(status->ok());
    }

    SECTION("Killed by a signal") {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "kill -TERM $$"}), 0);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE(status->signal == SIGTERM);
    }

    SECTION("Polling does not block") {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "sleep 0.3"}), 0);
        REQUIRE_FALSE(handle->poll());
        REQUIRE(waitExit(*handle));
    }
}

TEST_CASE("Programs that cannot be executed fail at launch", "[process]") {
    SystemLauncher launcher;
    REQUIRE_THROWS_AS(launcher.launch(Command::exec({"/nonexistent/poolflow-program"}), 0), LaunchError);
    REQUIRE_THROWS_AS(launcher.launch(Command(), 0), LaunchError);
}

TEST_CASE("Program output can be captured to a file", "[process]") {
    auto path = std::filesystem::temp_directory_path() / ("poolflow_output_" + std::to_string(getpid()) + ".log");
    std::filesystem::remove(path);

    SystemLauncher launcher;
    Command command = Command::exec({"/bin/sh", "-c", "echo out; echo err 1>&2"});
    command.outputPath = path;

    auto handle = launcher.launch(command, 0);
    auto status = waitExit(*handle);
    REQUIRE(status);
    REQUIRE(status->ok());

    std::ifstream file(path);
    std::string first, second;
    std::getline(file, first);
    std::getline(file, second);
    REQUIRE(first == "out");
    REQUIRE(second == "err");

    std::filesystem::remove(path);
}

TEST_CASE("Hard memory limits stop programs that exceed them", "[process][limits]") {
    SystemLauncher launcher(LimitMode::Hard);
    if (!launcher.limitsEnforced()) {
        WARN("address space limits not supported here");
        return;
    }

    // The shell cannot even map itself into 1 KiB of address space: either
    // exec fails and the launch throws, or the program dies early.
    try {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "exit 0"}), 1024);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE_FALSE(status->ok());
    } catch (const LaunchError& e) {
        REQUIRE(std::string(e.what()).find("cannot execute") != std::string::npos);
    }
}

TEST_CASE("Callables run on their own thread", "[process]") {
    SystemLauncher launcher;

    SECTION("Return value becomes the exit code") {
        auto handle = launcher.launch(Command::call([] { return 4; }, "four"), 0);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE(status->exitCode == 4);
        REQUIRE(handle->describe() == "thread four");
    }

    SECTION("Exceptions become failures") {
        auto handle = launcher.launch(Command::call([]() -> int { throw std::runtime_error("boom"); }), 0);
        auto status = waitExit(*handle);
        REQUIRE(status);
        REQUIRE_FALSE(status->ok());
        REQUIRE(status->error.find("boom") != std::string::npos);
    }
}

TEST_CASE("Dropping a handle leaves the job running", "[process]") {
    SystemLauncher launcher;

    SECTION("A detached program is still reaped when it exits") {
        auto handle = launcher.launch(Command::exec({"/bin/sh", "-c", "sleep 0.2"}), 0);
        std::string described = handle->describe();
        REQUIRE(described.rfind("pid ", 0) == 0);
        pid_t pid = static_cast<pid_t>(std::stol(described.substr(4)));

        handle.reset();

        // A zombie still answers kill(pid, 0); a reaped child does not.
        bool gone = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!gone && std::chrono::steady_clock::now() < deadline) {
            gone = ::kill(pid, 0) == -1 && errno == ESRCH;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(gone);
    }

    SECTION("A detached callable is not waited for") {
        static std::atomic<bool> release{false};
        auto finished = std::make_shared<std::atomic<bool>>(false);
        release = false;

        auto handle = launcher.launch(Command::call([finished] {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finished->store(true);
            return 0;
        }, "blocked"), 0);

        handle.reset();
        REQUIRE_FALSE(finished->load());

        release = true;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!finished->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(finished->load());
    }
}

}
}
