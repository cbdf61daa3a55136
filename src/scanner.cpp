/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/scanner.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"
#include <algorithm>

namespace poolflow {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept 
    : workspace_(workspace), readyPath_(workspace / layout::kReady) {
}

std::vector<TicketId> Scanner::scan() const noexcept {
    std::vector<TicketId> tickets;
    
    try {
        if (!std::filesystem::exists(readyPath_)) {
            LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
            return tickets;
        }

        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory() && isValidTicket(entry.path())) {
                tickets.push_back(entry.path().filename().string());
                LOG_TRACE("Found ticket: " + tickets.back());
            }
        }

        std::sort(tickets.begin(), tickets.end());
        
        if (!tickets.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(tickets.size()) + " ready tickets");
        }
        
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }
    
    return tickets;
}

std::size_t Scanner::readyCount() const noexcept {
    std::size_t count = 0;
    
    try {
        if (!std::filesystem::exists(readyPath_)) {
            return 0;
        }

        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory() && isValidTicket(entry.path())) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Ready count incomplete: " + std::string(e.what()));
    }
    
    return count;
}

bool Scanner::isValidTicket(const std::filesystem::path& dir) const noexcept {
    std::error_code ec;

    auto argvFile = dir / layout::kArgvFile;
    if (!std::filesystem::is_regular_file(argvFile, ec) || std::filesystem::file_size(argvFile, ec) == 0 || ec) {
        LOG_DEBUG("Invalid ticket (missing argv): " + dir.string());
        return false;
    }

    if (!std::filesystem::is_regular_file(dir / layout::kCostFile, ec)) {
        LOG_DEBUG("Invalid ticket (missing cost.txt): " + dir.string());
        return false;
    }

    return true;
}

}
