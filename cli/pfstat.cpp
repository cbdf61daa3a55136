/*
 * poolflow - Job status tool (pfstat)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/flow.hpp"
#include "poolflow/logger.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace poolflow;

void printUsage(const char* progName) {
    std::cout << "poolflow Job Status Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [--wait] [--output]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory watched by poolflowd\n";
    std::cout << "  job_id        Job ID printed by pfsub (optional)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job has finished\n";
    std::cout << "  -o, --output  Print the captured output of the job\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If job_id provided: show that job\n";
    std::cout << "  - If no job_id: show the latest finished job\n";
    std::cout << "  - Exit code 0 when done, 1 when failed or missing, 2 when not finished\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace 1731808123456_12345_0 --wait\n";
    std::cout << "  pfsub ./workspace --cost 1G -- make | " << progName << " ./workspace --wait\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    if (workspace == "-h" || workspace == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    std::string jobId;
    bool wait = false;
    bool showOutput = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-o" || arg == "--output") {
            showOutput = true;
        } else {
            jobId = arg;
        }
    }

    // Job id piped from pfsub
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        Flow flow(workspace);

        if (jobId.empty()) {
            auto latest = flow.latest();
            if (!latest) {
                std::cerr << "No finished jobs found" << std::endl;
                return 1;
            }
            jobId = latest->id;
        }

        if (wait) {
            while (true) {
                TicketStatus s = flow.status(jobId);
                if (s == TicketStatus::Done || s == TicketStatus::Failed || s == TicketStatus::Missing) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        auto ticket = flow.get(jobId);
        if (!ticket) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        std::cout << jobId << "  " << toString(ticket->status);
        if (!ticket->exit.empty()) {
            std::cout << "  " << ticket->exit;
        }
        std::cout << std::endl;

        if (showOutput) {
            if (auto output = flow.output(jobId)) {
                std::cout << *output;
            }
        }

        switch (ticket->status) {
            case TicketStatus::Done:
                return 0;
            case TicketStatus::Failed:
                if (!ticket->error.empty()) {
                    std::cerr << "Error: " << ticket->error;
                }
                return 1;
            default:
                return 2; // Different exit code for "not ready"
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
