/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/accountant.hpp"
#include "poolflow/config.hpp"
#include "poolflow/logger.hpp"
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace poolflow {

BoundedAccountant::BoundedAccountant(Cost capacity) noexcept : capacity_(capacity) {
}

bool BoundedAccountant::reserve(Cost cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cost > capacity_ - allocated_) {
        return false;
    }
    allocated_ += cost;
    return true;
}

void BoundedAccountant::release(Cost cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cost > allocated_) {
        throw AccountingError("release of " + std::to_string(cost) + " bytes exceeds allocated " +
                              std::to_string(allocated_) + " bytes");
    }
    allocated_ -= cost;
}

Cost BoundedAccountant::allocated() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_;
}

Cost BoundedAccountant::available() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - allocated_;
}

bool UnboundedAccountant::reserve(Cost cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Saturate rather than wrap; the amount is informational in this mode.
    allocated_ = cost > kUnbounded - allocated_ ? kUnbounded : allocated_ + cost;
    return true;
}

void UnboundedAccountant::release(Cost cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cost > allocated_) {
        throw AccountingError("release of " + std::to_string(cost) + " bytes exceeds allocated " +
                              std::to_string(allocated_) + " bytes");
    }
    allocated_ -= cost;
}

Cost UnboundedAccountant::allocated() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_;
}

std::optional<Cost> detectAvailableMemory() noexcept {
    try {
        std::ifstream meminfo("/proc/meminfo");
        std::string line;
        while (meminfo && std::getline(meminfo, line)) {
            if (line.rfind("MemAvailable:", 0) != 0) {
                continue;
            }
            std::istringstream fields(line.substr(13));
            unsigned long long kib = 0;
            std::string unit;
            if (fields >> kib >> unit && unit == "kB") {
                return static_cast<Cost>(kib) * 1024;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Could not read /proc/meminfo: " + std::string(e.what()));
    }

#if defined(_SC_AVPHYS_PAGES) && defined(_SC_PAGESIZE)
    long pages = ::sysconf(_SC_AVPHYS_PAGES);
    long pageSize = ::sysconf(_SC_PAGESIZE);
    if (pages > 0 && pageSize > 0) {
        return static_cast<Cost>(pages) * static_cast<Cost>(pageSize);
    }
#endif

    return std::nullopt;
}

std::unique_ptr<ResourceAccountant> makeAccountant(std::optional<Cost> capacity) {
    if (capacity) {
        LOG_DEBUG("Memory budget set to " + formatSize(*capacity));
        return std::make_unique<BoundedAccountant>(*capacity);
    }

    if (auto detected = detectAvailableMemory()) {
        LOG_INFO("Memory budget detected: " + formatSize(*detected) + " available");
        return std::make_unique<BoundedAccountant>(*detected);
    }

    LOG_WARN("Available memory cannot be queried on this platform; "
             "memory budget is NOT enforced and jobs may oversubscribe memory");
    return std::make_unique<UnboundedAccountant>();
}

}
