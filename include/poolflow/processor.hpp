/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "poolflow/job.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

// Contents of a ticket directory.
struct Ticket {
    TicketId id;
    Cost cost = 0;
    std::vector<std::string> argv;
    std::string label;
};

// Moves tickets through the workspace phases and turns them into pool jobs.
class Processor {
public:
    explicit Processor(const std::filesystem::path& workspace);
    
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Moves the ticket from ready to processing and builds the job for it. The
    // job writes its output into the ticket and its post-hook finalizes the
    // ticket. nullopt if the ticket vanished or is unreadable (then it is
    // moved to failed).
    [[nodiscard]] std::optional<JobSpec> claim(const TicketId& id) noexcept;

    // Moves a claimed ticket to failed with the given reason.
    bool reject(const TicketId& id, const std::string& reason) noexcept;

    // Records the exit status and moves the ticket to output or failed.
    bool finalize(const TicketId& id, const ExitStatus& status) noexcept;

    // Tickets left in processing by a previous daemon are moved to failed.
    [[nodiscard]] std::size_t failOrphans() noexcept;

    [[nodiscard]] static std::optional<Ticket> readTicket(const std::filesystem::path& dir);

private:
    std::filesystem::path workspace_;
    
    [[nodiscard]] bool moveReadyToProcessing(const TicketId& id) noexcept;
    [[nodiscard]] bool finalizeSuccess(const TicketId& id, const ExitStatus& status) noexcept;
    [[nodiscard]] bool finalizeFailure(const TicketId& id, const std::string& error, const ExitStatus* status) noexcept;
    [[nodiscard]] std::filesystem::path getTicketPath(const char* phase, const TicketId& id) const;
};

}
