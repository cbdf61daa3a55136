/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/config.hpp"
#include "poolflow/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace poolflow {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

const char* env(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return nullptr;
    }
    return val;
}
}

std::optional<Cost> parseSize(const std::string& text) noexcept {
    try {
        std::string value = toLowerCopy(trimCopy(text));
        if (value.empty()) {
            return std::nullopt;
        }

        std::size_t pos = 0;
        while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) {
            ++pos;
        }
        if (pos == 0) {
            return std::nullopt;
        }

        std::string number = value.substr(0, pos);
        std::string unit = trimCopy(value.substr(pos));

        long double multiplier = 1;
        if (unit.empty() || unit == "b") {
            multiplier = 1;
        } else {
            if (unit.size() > 1 && unit.back() == 'b') {
                unit.pop_back();
                if (unit.size() > 1 && unit.back() == 'i') {
                    unit.pop_back();
                }
            }
            if (unit == "k") multiplier = 1024.0L;
            else if (unit == "m") multiplier = 1024.0L * 1024;
            else if (unit == "g") multiplier = 1024.0L * 1024 * 1024;
            else if (unit == "t") multiplier = 1024.0L * 1024 * 1024 * 1024;
            else return std::nullopt;
        }

        std::size_t consumed = 0;
        long double parsed = std::stold(number, &consumed);
        if (consumed != number.size() || parsed < 0) {
            return std::nullopt;
        }

        long double bytes = std::floor(parsed * multiplier);
        if (bytes >= static_cast<long double>(kUnbounded)) {
            return std::nullopt;
        }
        return static_cast<Cost>(bytes);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatSize(Cost bytes) {
    if (bytes == kUnbounded) {
        return "unbounded";
    }

    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return oss.str();
}

std::optional<LimitMode> parseLimitMode(const std::string& text) noexcept {
    std::string value = toLowerCopy(trimCopy(text));
    if (value == "off" || value == "none") return LimitMode::Off;
    if (value == "soft") return LimitMode::Soft;
    if (value == "hard") return LimitMode::Hard;
    return std::nullopt;
}

const char* toString(LimitMode mode) noexcept {
    switch (mode) {
        case LimitMode::Off: return "off";
        case LimitMode::Soft: return "soft";
        case LimitMode::Hard: return "hard";
        default: return "unknown";
    }
}

std::optional<std::chrono::milliseconds> parseMillis(const std::string& text) noexcept {
    try {
        std::string value = trimCopy(text);
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        auto parsed = std::stoll(value);
        if (parsed <= 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

PoolConfig PoolConfig::fromEnv() {
    PoolConfig config;

    if (const char* val = env("POOLFLOW_CAPACITY")) {
        if (auto size = parseSize(val)) {
            config.capacity = *size;
        } else {
            LOG_WARN(std::string("Ignoring invalid POOLFLOW_CAPACITY: ") + val);
        }
    }

    if (const char* val = env("POOLFLOW_TICK_MS")) {
        if (auto ms = parseMillis(val)) {
            config.tickInterval = *ms;
        } else {
            LOG_WARN(std::string("Ignoring invalid POOLFLOW_TICK_MS: ") + val);
        }
    }

    if (const char* val = env("POOLFLOW_REFRESH_MS")) {
        if (auto ms = parseMillis(val)) {
            config.refreshInterval = *ms;
        } else {
            LOG_WARN(std::string("Ignoring invalid POOLFLOW_REFRESH_MS: ") + val);
        }
    }

    if (const char* val = env("POOLFLOW_MEMORY_LIMIT")) {
        if (auto mode = parseLimitMode(val)) {
            config.limits = *mode;
        } else {
            LOG_WARN(std::string("Ignoring invalid POOLFLOW_MEMORY_LIMIT: ") + val);
        }
    }

    if (const char* val = env("POOLFLOW_STATUS_FILE")) {
        config.statusFile = val;
    }

    return config;
}

bool PoolConfig::isOption(const std::string& flag) noexcept {
    return flag == "--capacity" || flag == "--tick" || flag == "--refresh" ||
           flag == "--limit" || flag == "--status-file";
}

std::optional<std::string> PoolConfig::applyOption(const std::string& flag, const std::string& value) {
    if (flag == "--capacity") {
        auto size = parseSize(value);
        if (!size) return "Invalid capacity: " + value;
        capacity = *size;
    } else if (flag == "--tick" || flag == "--refresh") {
        auto ms = parseMillis(value);
        if (!ms) return "Invalid interval (milliseconds): " + value;
        (flag == "--tick" ? tickInterval : refreshInterval) = *ms;
    } else if (flag == "--limit") {
        auto mode = parseLimitMode(value);
        if (!mode) return "Invalid limit mode (off, soft, hard): " + value;
        limits = *mode;
    } else if (flag == "--status-file") {
        if (value.empty()) return std::string("Empty status file path");
        statusFile = value;
    } else {
        return "Unknown option: " + flag;
    }
    return std::nullopt;
}

}
