/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/logger.hpp"

namespace poolflow {
namespace unittest {

TEST_CASE("Log levels parse in any case", "[logger]") {
    LogLevel level = LogLevel::INFO;

    REQUIRE(Logger::parseLevel("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("WARNING", level));
    REQUIRE(level == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("Trace", level));
    REQUIRE(level == LogLevel::TRACE);

    REQUIRE_FALSE(Logger::parseLevel("loud", level));
    REQUIRE(level == LogLevel::TRACE);
}

TEST_CASE("The log level can be changed at runtime", "[logger]") {
    LogLevel previous = Logger::level();

    Logger::setLevel(LogLevel::TRACE);
    REQUIRE(Logger::level() == LogLevel::TRACE);
    Logger::trace("visible at trace level");

    Logger::setLevel(LogLevel::ERROR);
    REQUIRE(Logger::level() == LogLevel::ERROR);
    Logger::info("suppressed");

    Logger::setLevel(previous);
}

}
}
