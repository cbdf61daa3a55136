/*
 * poolflow - Job submission tool (pfsub)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/config.hpp"
#include "poolflow/logger.hpp"
#include "poolflow/work.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace poolflow;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "poolflow Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> --cost SIZE [--label NAME] [--] <program> [args...]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory watched by poolflowd\n";
    std::cout << "  program       Program to run, searched in PATH\n\n";
    std::cout << "Options:\n";
    std::cout << "  --cost SIZE     Memory the job needs (e.g. 512M, 2G, 1.5GiB)\n";
    std::cout << "  --label NAME    Name shown in status tables\n";
    std::cout << "  --              End of options, the rest is the command\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  POOLFLOW_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace --cost 2G -- ./simulate --steps 100\n";
    std::cout << "  id=$(" << progName << " ./workspace --cost 512M sort big.txt)\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; POOLFLOW_LOG_LEVEL overrides
    if (!std::getenv("POOLFLOW_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace;
    std::string costText;
    std::string label;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!command.empty()) {
            command.push_back(arg);
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                command.emplace_back(argv[i]);
            }
            break;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--cost" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --cost requires a size\n";
                return 1;
            }
            costText = argv[++i];
        } else if (arg == "--label" || arg == "-l") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --label requires a name\n";
                return 1;
            }
            label = argv[++i];
        } else if (workspace.empty()) {
            workspace = arg;
        } else {
            // First non-option argument after the workspace starts the command
            command.push_back(arg);
        }
    }

    if (workspace.empty() || command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (costText.empty()) {
        std::cerr << "Error: --cost is required\n";
        return 1;
    }

    auto cost = parseSize(costText);
    if (!cost) {
        std::cerr << "Error: Invalid cost: " << costText << "\n";
        return 1;
    }

    try {
        Work work(workspace, true);

        auto result = work.submit(*cost, command, label);
        if (result.ok) {
            // Just the job ID - clean for piping, no noise
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
