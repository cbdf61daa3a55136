/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "poolflow/logger.hpp"
#include <cstdlib>

int main(int argc, char** argv) {
    // Keep test output readable; POOLFLOW_LOG_LEVEL=DEBUG to see scheduling
    if (std::getenv("POOLFLOW_LOG_LEVEL")) {
        poolflow::Logger::initFromEnv();
    } else {
        poolflow::Logger::setLevel(poolflow::LogLevel::ERROR);
    }

    Catch::Session session;

    int return_code = session.applyCommandLine(argc, argv);
    if (return_code != 0) {
        return return_code;
    }

    return session.run();
}
