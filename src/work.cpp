/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/work.hpp"
#include "poolflow/logger.hpp"
#include "poolflow/layout.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace poolflow {

Work::Work(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    if (!layout::exists(workspace_) && (!createIfMissing || !layout::create(workspace_))) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

TicketResult Work::submit(Cost cost, const std::vector<std::string>& argv, const std::string& label) {
    if (argv.empty() || argv.front().empty()) {
        LOG_DEBUG("Invalid command: empty");
        return {false, "", SubmitError::InvalidCommand, "Command is empty"};
    }

    std::size_t total = 0;
    for (const auto& arg : argv) {
        if (arg.find('\0') != std::string::npos) {
            return {false, "", SubmitError::InvalidCommand, "Arguments must not contain NUL bytes"};
        }
        total += arg.size() + 1;
    }
    if (total > maxBytes_) {
        LOG_DEBUG("Command exceeds size limit: " + std::to_string(total) + " > " + std::to_string(maxBytes_));
        return {false, "", SubmitError::InvalidSize,
                "Command exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    if (!layout::exists(workspace_)) {
        return {false, "", SubmitError::WorkspaceError, "Not a workspace: " + workspace_.string()};
    }

    TicketId id = generateId();
    LOG_DEBUG("Generated ticket ID: " + id);

    if (!writeTicket(id, cost, argv, label)) {
        LOG_ERROR("Failed to write ticket: " + id);
        cleanupFailedTicket(id);
        return {false, "", SubmitError::IoError, "Failed to write ticket"};
    }

    if (!atomicPublish(id)) {
        LOG_ERROR("Failed to publish ticket: " + id);
        cleanupFailedTicket(id);
        return {false, "", SubmitError::IoError, "Failed to publish ticket"};
    }

    LOG_INFO("Ticket submitted: " + id);
    return {true, id, SubmitError::None, ""};
}

TicketId Work::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::to_string(now) << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool Work::writeTicket(const TicketId& id, Cost cost, const std::vector<std::string>& argv,
                       const std::string& label) const noexcept {
    try {
        auto ticketDir = layout::ticketPath(workspace_, layout::kWriting, id);
        std::filesystem::create_directories(ticketDir);

        {
            std::ofstream file(ticketDir / layout::kCostFile, std::ios::binary);
            if (!file) return false;
            file << cost << "\n";
            if (!file.good()) return false;
        }
        {
            std::ofstream file(ticketDir / layout::kArgvFile, std::ios::binary);
            if (!file) return false;
            for (const auto& arg : argv) {
                file << arg << '\0';
            }
            if (!file.good()) return false;
        }
        if (!label.empty()) {
            std::ofstream file(ticketDir / layout::kLabelFile, std::ios::binary);
            if (!file) return false;
            file << label;
            if (!file.good()) return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Ticket write error: " + std::string(e.what()));
        return false;
    }
}

bool Work::atomicPublish(const TicketId& id) const noexcept {
    std::error_code ec;
    std::filesystem::rename(layout::ticketPath(workspace_, layout::kWriting, id),
                            layout::ticketPath(workspace_, layout::kReady, id), ec);
    if (ec) {
        LOG_DEBUG("Publish failed: " + ec.message());
        return false;
    }
    return true;
}

void Work::cleanupFailedTicket(const TicketId& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(layout::ticketPath(workspace_, layout::kWriting, id), ec);
}

}
