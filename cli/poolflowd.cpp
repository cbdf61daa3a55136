/*
 * poolflow - Pool daemon (poolflowd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/config.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"
#include "poolflow/server.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace poolflow;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

void printUsage(const char* progName) {
    std::cout << "poolflow Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <workspace>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory watched for submitted jobs (created if missing)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --capacity SIZE      Memory budget (default: available memory)\n";
    std::cout << "  --tick MS            Scheduling and scan interval (default: 1000)\n";
    std::cout << "  --refresh MS         Status refresh interval (default: 5000)\n";
    std::cout << "  --limit MODE         Per-job address space limit: off, soft, hard\n";
    std::cout << "  --status-file PATH   Write status to a file instead of the console\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "SIGINT or SIGTERM stops accepting jobs and waits for running ones.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --capacity 16G ./workspace\n";
    std::cout << "  pfsub ./workspace --cost 2G -- ./simulate --steps 100\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    PoolConfig config = PoolConfig::fromEnv();
    std::string workspace;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (PoolConfig::isOption(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            if (auto error = config.applyOption(arg, argv[++i])) {
                std::cerr << "Error: " << *error << "\n";
                return 1;
            }
        } else if (workspace.empty()) {
            workspace = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (workspace.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path pidPath = std::filesystem::path(workspace) / layout::kPidFile;
    if (auto pid = readPidFile(pidPath)) {
        if (isProcessAlive(*pid)) {
            std::cerr << "Error: Daemon already running on " << workspace << " (pid " << *pid << ")\n";
            return 1;
        }
        LOG_WARN("Removing stale pid file: " + pidPath.string());
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "  \033[1mpoolflow\033[0m " << VERSION << "                     \033[90mmemory · budgeted · jobs\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";

    try {
        auto server = std::make_unique<Server>(workspace, config);

        if (!server->start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Workspace  " << workspace << "\n";
        std::cout << "    Capacity   " << (config.capacity ? formatSize(*config.capacity) : std::string("detected")) << "\n";
        std::cout << "    Limits     " << toString(config.limits) << "\n";
        std::cout << "\n";
        std::cout << "  Submit:  pfsub " << workspace << " --cost <size> -- <program> [args...]\n";
        std::cout << "  Status:  pfstat " << workspace << " <job-id>\n";
        std::cout << "\n";

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        bool faulted = !g_shutdown_requested;
        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, draining running jobs..." << std::endl;
        } else {
            LOG_ERROR("Scheduling loop stopped unexpectedly");
        }
        server->shutdown();
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        return faulted ? 1 : 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        std::error_code ec;
        std::filesystem::remove(pidPath, ec);
        return 1;
    }
}
