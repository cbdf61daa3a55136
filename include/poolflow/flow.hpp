/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "poolflow/types.hpp"

namespace poolflow {

struct TicketInfo {
    TicketId id;
    TicketStatus status = TicketStatus::Missing;
    std::string exit;     // exit.txt, once the program has exited
    std::string error;    // error.txt, failed tickets only
    std::chrono::system_clock::time_point timestamp;
};

// Read-only view of ticket outcomes in a workspace.
class Flow {
public:
    explicit Flow(const std::filesystem::path& workspace) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;
    Flow(Flow&&) noexcept = default;
    Flow& operator=(Flow&&) noexcept = default;

    [[nodiscard]] std::optional<TicketInfo> latest() const noexcept;
    [[nodiscard]] std::optional<TicketInfo> get(const TicketId& id) const noexcept;
    // Finished tickets, newest first.
    [[nodiscard]] std::vector<TicketInfo> list(std::size_t max = 10) const noexcept;
    [[nodiscard]] TicketStatus status(const TicketId& id) const noexcept;

    [[nodiscard]] bool exists(const TicketId& id) const noexcept;
    [[nodiscard]] std::optional<std::string> error(const TicketId& id) const;
    // Captured stdout and stderr of the program.
    [[nodiscard]] std::optional<std::string> output(const TicketId& id) const;

private:
    std::filesystem::path workspace_;

    [[nodiscard]] std::optional<std::filesystem::path> locate(const TicketId& id) const;
};

}
