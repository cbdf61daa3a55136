/*
 * poolflow - Static pool runner (poolflow)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/config.hpp"
#include "poolflow/jobfile.hpp"
#include "poolflow/logger.hpp"
#include "poolflow/pool.hpp"
#include "poolflow/reporter.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace poolflow;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "poolflow Static Pool Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <jobfile>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  jobfile       One job per line: <cost> <program> [args...]\n";
    std::cout << "                Blank lines and lines starting with # are ignored\n\n";
    std::cout << "Options:\n";
    std::cout << "  --capacity SIZE      Memory budget (default: available memory)\n";
    std::cout << "  --tick MS            Scheduling interval (default: 1000)\n";
    std::cout << "  --refresh MS         Status refresh interval (default: 5000)\n";
    std::cout << "  --limit MODE         Per-job address space limit: off, soft, hard\n";
    std::cout << "  --status-file PATH   Write status to a file instead of the console\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  POOLFLOW_CAPACITY, POOLFLOW_TICK_MS, POOLFLOW_REFRESH_MS,\n";
    std::cout << "  POOLFLOW_MEMORY_LIMIT, POOLFLOW_STATUS_FILE\n";
    std::cout << "  POOLFLOW_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --capacity 8G jobs.txt\n";
    std::cout << "  echo '2G ./simulate --steps 100' > jobs.txt\n";
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
    std::string jobFile;

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
        } else if (jobFile.empty()) {
            jobFile = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (jobFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto jobs = loadJobFile(jobFile);
        if (jobs.empty()) {
            std::cerr << "Error: No jobs in " << jobFile << "\n";
            return 1;
        }

        auto pool = Pool::create(PoolMode::Static, config, std::move(jobs));
        if (config.statusFile.empty()) {
            pool->setReporter(std::make_shared<TableReporter>(std::cout));
        } else {
            pool->setReporter(std::make_shared<FileReporter>(config.statusFile));
        }

        if (!pool->start()) {
            std::cerr << "Error: Failed to start pool\n";
            return 1;
        }

        while (!g_shutdown_requested && !pool->waitFor(std::chrono::milliseconds(100))) {
        }

        if (g_shutdown_requested) {
            std::cout << "\nInterrupted, stopping scheduler..." << std::endl;
            pool->stop();
            return 130;
        }

        pool->wait();

        if (auto fault = pool->fault()) {
            std::cerr << "Error: Pool faulted: " << *fault << "\n";
            return 1;
        }

        auto snapshot = pool->snapshot();
        return (snapshot.failed == 0 && snapshot.rejected == 0) ? 0 : 1;

    } catch (const JobFileError& e) {
        std::cerr << "Error: " << jobFile << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
