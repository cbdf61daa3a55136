/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/processor.hpp"
#include "poolflow/config.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", std::localtime(&time));
    return buf;
}

void announce(const std::string& id, const std::string& what) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << id << "  " << what << "\n" << std::flush;
}

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file << content;
    file.flush();
    return file.good();
}

}

namespace poolflow {

Processor::Processor(const std::filesystem::path& workspace)
    : workspace_(workspace) {
    LOG_DEBUG("Processor created for workspace: " + workspace_.string());
}

std::optional<Ticket> Processor::readTicket(const std::filesystem::path& dir) {
    Ticket ticket;
    ticket.id = dir.filename().string();

    {
        std::ifstream file(dir / layout::kCostFile);
        std::string text;
        if (!file || !std::getline(file, text)) {
            return std::nullopt;
        }
        auto cost = parseSize(text);
        if (!cost) {
            return std::nullopt;
        }
        ticket.cost = *cost;
    }

    {
        std::ifstream file(dir / layout::kArgvFile, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        std::size_t start = 0;
        while (start < content.size()) {
            auto end = content.find('\0', start);
            if (end == std::string::npos) {
                end = content.size();
            }
            ticket.argv.push_back(content.substr(start, end - start));
            start = end + 1;
        }
        if (ticket.argv.empty() || ticket.argv.front().empty()) {
            return std::nullopt;
        }
    }

    std::ifstream label(dir / layout::kLabelFile);
    if (label) {
        std::getline(label, ticket.label);
    }
    if (ticket.label.empty()) {
        ticket.label = ticket.id;
    }
    return ticket;
}

std::optional<JobSpec> Processor::claim(const TicketId& id) noexcept {
    try {
        if (!moveReadyToProcessing(id)) {
            LOG_DEBUG("Ticket not found or already claimed: " + id);
            return std::nullopt;
        }

        auto dir = getTicketPath(layout::kProcessing, id);
        auto ticket = readTicket(dir);
        if (!ticket) {
            LOG_WARN("Unreadable ticket: " + id);
            (void)finalizeFailure(id, "Unreadable ticket (cost.txt or argv)", nullptr);
            return std::nullopt;
        }

        JobSpec spec;
        spec.cost = ticket->cost;
        spec.label = ticket->label;
        spec.command = Command::exec(ticket->argv);
        spec.command.outputPath = dir / layout::kOutputLog;
        spec.preHook = [id](const Job&) {
            announce(id, "\033[33mrunning\033[0m");
        };
        spec.postHook = [this, id](const Job&, const ExitStatus& status) {
            (void)finalize(id, status);
        };
        return spec;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception claiming ticket " + id + ": " + std::string(e.what()));
        (void)finalizeFailure(id, "Internal processing error: " + std::string(e.what()), nullptr);
        return std::nullopt;
    }
}

bool Processor::reject(const TicketId& id, const std::string& reason) noexcept {
    announce(id, "\033[31mrejected\033[0m  " + reason);
    return finalizeFailure(id, reason, nullptr);
}

bool Processor::finalize(const TicketId& id, const ExitStatus& status) noexcept {
    if (status.ok()) {
        announce(id, "\033[32mdone\033[0m");
        return finalizeSuccess(id, status);
    }
    announce(id, "\033[31mfailed\033[0m  " + status.describe());
    return finalizeFailure(id, status.describe(), &status);
}

std::size_t Processor::failOrphans() noexcept {
    std::size_t count = 0;
    try {
        auto processingDir = workspace_ / layout::kProcessing;
        if (!std::filesystem::exists(processingDir)) {
            return 0;
        }

        std::vector<TicketId> orphans;
        for (const auto& entry : std::filesystem::directory_iterator(processingDir)) {
            if (entry.is_directory()) {
                orphans.push_back(entry.path().filename().string());
            }
        }

        for (const auto& id : orphans) {
            LOG_WARN("Orphaned ticket from a previous daemon: " + id);
            if (finalizeFailure(id, "Daemon stopped while the job was running", nullptr)) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error collecting orphaned tickets: " + std::string(e.what()));
    }
    return count;
}

bool Processor::moveReadyToProcessing(const TicketId& id) noexcept {
    try {
        std::error_code ec;
        std::filesystem::rename(getTicketPath(layout::kReady, id), getTicketPath(layout::kProcessing, id), ec);
        if (ec) {
            LOG_DEBUG("Ticket already claimed or missing: " + id);
            return false;
        }
        LOG_DEBUG("Ticket moved to processing: " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to move ticket to processing: " + std::string(e.what()));
        return false;
    }
}

bool Processor::finalizeSuccess(const TicketId& id, const ExitStatus& status) noexcept {
    try {
        auto processingPath = getTicketPath(layout::kProcessing, id);

        auto tempExitPath = processingPath / "exit.txt.tmp";
        if (!writeFile(tempExitPath, status.describe() + "\n")) {
            return false;
        }
        std::filesystem::rename(tempExitPath, processingPath / layout::kExitFile);

        std::filesystem::rename(processingPath, getTicketPath(layout::kOutput, id));

        LOG_DEBUG("Ticket finalized successfully: " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize success for ticket " + id + ": " + std::string(e.what()));
        return false;
    }
}

bool Processor::finalizeFailure(const TicketId& id, const std::string& error, const ExitStatus* status) noexcept {
    try {
        auto processingPath = getTicketPath(layout::kProcessing, id);

        if (status && !writeFile(processingPath / layout::kExitFile, status->describe() + "\n")) {
            LOG_WARN("Could not write exit status for ticket: " + id);
        }
        if (!writeFile(processingPath / layout::kErrorFile, error + "\n")) {
            LOG_WARN("Could not write error file for ticket: " + id);
        }

        std::filesystem::rename(processingPath, getTicketPath(layout::kFailed, id));

        LOG_DEBUG("Ticket moved to failed: " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize failure for ticket " + id + ": " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path Processor::getTicketPath(const char* phase, const TicketId& id) const {
    return layout::ticketPath(workspace_, phase, id);
}

}
