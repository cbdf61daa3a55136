/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/config.hpp"
#include <cstdlib>

namespace poolflow {
namespace unittest {

TEST_CASE("Sizes parse with binary suffixes", "[config]") {
    REQUIRE(parseSize("0") == Cost(0));
    REQUIRE(parseSize("1048576") == Cost(1048576));
    REQUIRE(parseSize("512K") == Cost(512) * 1024);
    REQUIRE(parseSize("20G") == Cost(20) * 1024 * 1024 * 1024);
    REQUIRE(parseSize("1.5GiB") == Cost(1536) * 1024 * 1024);
    REQUIRE(parseSize("4 GB") == Cost(4) * 1024 * 1024 * 1024);
    REQUIRE(parseSize(" 2m ") == Cost(2) * 1024 * 1024);
    REQUIRE(parseSize("100b") == Cost(100));
}

TEST_CASE("Malformed sizes are refused", "[config]") {
    REQUIRE_FALSE(parseSize(""));
    REQUIRE_FALSE(parseSize("G"));
    REQUIRE_FALSE(parseSize("-5"));
    REQUIRE_FALSE(parseSize("12X"));
    REQUIRE_FALSE(parseSize("1.2.3"));
    REQUIRE_FALSE(parseSize("99999999999T"));
}

TEST_CASE("Sizes format for humans", "[config]") {
    REQUIRE(formatSize(512) == "512 B");
    REQUIRE(formatSize(Cost(1536) * 1024 * 1024) == "1.5 GiB");
    REQUIRE(formatSize(kUnbounded) == "unbounded");
}

TEST_CASE("Limit modes and intervals parse", "[config]") {
    REQUIRE(parseLimitMode("off") == LimitMode::Off);
    REQUIRE(parseLimitMode("NONE") == LimitMode::Off);
    REQUIRE(parseLimitMode("Soft") == LimitMode::Soft);
    REQUIRE(parseLimitMode("hard") == LimitMode::Hard);
    REQUIRE_FALSE(parseLimitMode("strict"));

    REQUIRE(parseMillis("250") == std::chrono::milliseconds(250));
    REQUIRE_FALSE(parseMillis("0"));
    REQUIRE_FALSE(parseMillis("1.5"));
    REQUIRE_FALSE(parseMillis("-10"));
}

TEST_CASE("Configuration is read from the environment", "[config]") {
    setenv("POOLFLOW_CAPACITY", "2G", 1);
    setenv("POOLFLOW_TICK_MS", "250", 1);
    setenv("POOLFLOW_REFRESH_MS", "not-a-number", 1);
    setenv("POOLFLOW_MEMORY_LIMIT", "hard", 1);
    setenv("POOLFLOW_STATUS_FILE", "/tmp/poolflow-status.txt", 1);

    PoolConfig config = PoolConfig::fromEnv();

    unsetenv("POOLFLOW_CAPACITY");
    unsetenv("POOLFLOW_TICK_MS");
    unsetenv("POOLFLOW_REFRESH_MS");
    unsetenv("POOLFLOW_MEMORY_LIMIT");
    unsetenv("POOLFLOW_STATUS_FILE");

    REQUIRE(config.capacity == Cost(2) * 1024 * 1024 * 1024);
    REQUIRE(config.tickInterval == std::chrono::milliseconds(250));
    // Invalid values keep the default
    REQUIRE(config.refreshInterval == std::chrono::milliseconds(5000));
    REQUIRE(config.limits == LimitMode::Hard);
    REQUIRE(config.statusFile.string() == "/tmp/poolflow-status.txt");

    PoolConfig defaults = PoolConfig::fromEnv();
    REQUIRE_FALSE(defaults.capacity);
    REQUIRE(defaults.limits == LimitMode::Off);
    REQUIRE(defaults.statusFile.empty());
}

TEST_CASE("Command-line options override the configuration", "[config]") {
    PoolConfig config;

    REQUIRE(PoolConfig::isOption("--capacity"));
    REQUIRE_FALSE(PoolConfig::isOption("--cost"));

    REQUIRE_FALSE(config.applyOption("--capacity", "1G"));
    REQUIRE_FALSE(config.applyOption("--tick", "50"));
    REQUIRE_FALSE(config.applyOption("--refresh", "75"));
    REQUIRE_FALSE(config.applyOption("--limit", "soft"));
    REQUIRE_FALSE(config.applyOption("--status-file", "status.txt"));

    REQUIRE(config.capacity == Cost(1024) * 1024 * 1024);
    REQUIRE(config.tickInterval == std::chrono::milliseconds(50));
    REQUIRE(config.refreshInterval == std::chrono::milliseconds(75));
    REQUIRE(config.limits == LimitMode::Soft);
    REQUIRE(config.statusFile.string() == "status.txt");

    REQUIRE(config.applyOption("--capacity", "lots"));
    REQUIRE(config.applyOption("--limit", "strict"));
    REQUIRE(config.applyOption("--bogus", "1"));
    // Failed options leave the previous values alone
    REQUIRE(config.limits == LimitMode::Soft);
}

}
}
