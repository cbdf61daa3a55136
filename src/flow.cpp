/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/flow.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"
#include <algorithm>
#include <fstream>

namespace poolflow {

namespace {

std::string readContent(const std::filesystem::path& file) {
    std::ifstream in(file);
    std::string content, line;
    while (std::getline(in, line)) {
        content += line + "\n";
    }
    return content;
}

std::chrono::system_clock::time_point modified(const std::filesystem::path& path) {
    auto timestamp = std::filesystem::last_write_time(path);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        timestamp - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

}

Flow::Flow(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
    LOG_DEBUG("Flow created for workspace: " + workspace_.string());
}

std::optional<TicketInfo> Flow::latest() const noexcept {
    std::vector<TicketInfo> tickets = list(1);
    if (tickets.empty()) {
        return std::nullopt;
    }
    return tickets[0];
}

std::optional<TicketInfo> Flow::get(const TicketId& id) const noexcept {
    try {
        TicketStatus ticketStatus = status(id);

        if (ticketStatus == TicketStatus::Missing) {
            return std::nullopt;
        }

        TicketInfo info{id, ticketStatus, "", "", std::chrono::system_clock::now()};
        if (ticketStatus == TicketStatus::Done || ticketStatus == TicketStatus::Failed) {
            auto dir = layout::ticketPath(workspace_,
                                          ticketStatus == TicketStatus::Done ? layout::kOutput : layout::kFailed, id);
            auto exitFile = dir / layout::kExitFile;
            if (std::filesystem::exists(exitFile)) {
                info.exit = readContent(exitFile);
                if (!info.exit.empty() && info.exit.back() == '\n') {
                    info.exit.pop_back();
                }
            }
            auto errorFile = dir / layout::kErrorFile;
            if (std::filesystem::exists(errorFile)) {
                info.error = readContent(errorFile);
            }
            info.timestamp = modified(dir);
        }
        return info;

    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving ticket " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<TicketInfo> Flow::list(std::size_t max) const noexcept {
    std::vector<TicketInfo> tickets;
    try {
        auto collect = [&](const char* phase, TicketStatus ticketStatus) {
            auto dir = workspace_ / phase;
            if (!std::filesystem::exists(dir)) {
                return;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_directory()) {
                    tickets.push_back({entry.path().filename().string(), ticketStatus, "", "", modified(entry.path())});
                }
            }
        };
        collect(layout::kOutput, TicketStatus::Done);
        collect(layout::kFailed, TicketStatus::Failed);

        std::sort(tickets.begin(), tickets.end(), [](const TicketInfo& a, const TicketInfo& b) {
            return a.timestamp > b.timestamp;
        });

        if (tickets.size() > max) {
            tickets.resize(max);
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Error listing tickets: " + std::string(e.what()));
    }

    return tickets;
}

TicketStatus Flow::status(const TicketId& id) const noexcept {
    try {
        // Check in order of completion states
        if (std::filesystem::exists(layout::ticketPath(workspace_, layout::kOutput, id))) {
            return TicketStatus::Done;
        }
        if (std::filesystem::exists(layout::ticketPath(workspace_, layout::kFailed, id))) {
            return TicketStatus::Failed;
        }
        if (std::filesystem::exists(layout::ticketPath(workspace_, layout::kProcessing, id))) {
            return TicketStatus::Running;
        }
        if (std::filesystem::exists(layout::ticketPath(workspace_, layout::kReady, id))) {
            return TicketStatus::Queued;
        }

        return TicketStatus::Missing;

    } catch (const std::exception& e) {
        LOG_ERROR("Error checking ticket " + id + ": " + e.what());
        return TicketStatus::Missing;
    }
}

bool Flow::exists(const TicketId& id) const noexcept {
    return status(id) != TicketStatus::Missing;
}

std::optional<std::string> Flow::error(const TicketId& id) const {
    auto errorFile = layout::ticketPath(workspace_, layout::kFailed, id) / layout::kErrorFile;
    if (!std::filesystem::exists(errorFile)) {
        return std::nullopt;
    }
    return readContent(errorFile);
}

std::optional<std::string> Flow::output(const TicketId& id) const {
    auto dir = locate(id);
    if (!dir || !std::filesystem::exists(*dir / layout::kOutputLog)) {
        return std::nullopt;
    }
    return readContent(*dir / layout::kOutputLog);
}

std::optional<std::filesystem::path> Flow::locate(const TicketId& id) const {
    for (const char* phase : {layout::kOutput, layout::kFailed, layout::kProcessing, layout::kReady}) {
        auto dir = layout::ticketPath(workspace_, phase, id);
        if (std::filesystem::exists(dir)) {
            return dir;
        }
    }
    return std::nullopt;
}

}
