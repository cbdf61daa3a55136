/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "poolflow/types.hpp"

namespace poolflow {

// Per-job virtual memory limit applied to launched programs.
enum class LimitMode : uint8_t { Off, Soft, Hard };

struct PoolConfig {
    // Unset means "detect available memory".
    std::optional<Cost> capacity;
    std::chrono::milliseconds tickInterval{1000};
    std::chrono::milliseconds refreshInterval{5000};
    LimitMode limits = LimitMode::Off;
    // Empty means status goes to the console.
    std::filesystem::path statusFile;

    // Reads POOLFLOW_CAPACITY, POOLFLOW_TICK_MS, POOLFLOW_REFRESH_MS,
    // POOLFLOW_MEMORY_LIMIT and POOLFLOW_STATUS_FILE. Invalid values keep
    // the default and are logged.
    [[nodiscard]] static PoolConfig fromEnv();

    // Command-line overrides: --capacity, --tick, --refresh, --limit and
    // --status-file, each followed by a value.
    [[nodiscard]] static bool isOption(const std::string& flag) noexcept;
    // Error message if the value is invalid for the flag.
    [[nodiscard]] std::optional<std::string> applyOption(const std::string& flag, const std::string& value);
};

// "1048576", "512K", "20G", "1.5GiB", "4 GB". Binary multiples.
[[nodiscard]] std::optional<Cost> parseSize(const std::string& text) noexcept;
[[nodiscard]] std::string formatSize(Cost bytes);

[[nodiscard]] std::optional<LimitMode> parseLimitMode(const std::string& text) noexcept;
const char* toString(LimitMode mode) noexcept;

[[nodiscard]] std::optional<std::chrono::milliseconds> parseMillis(const std::string& text) noexcept;

}
