/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "poolflow/types.hpp"

namespace poolflow {

// Lists published tickets waiting in input/ready.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;
    
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Oldest first (ticket ids start with a timestamp).
    [[nodiscard]] std::vector<TicketId> scan() const noexcept;
    [[nodiscard]] std::size_t readyCount() const noexcept;

private:
    std::filesystem::path workspace_;
    std::filesystem::path readyPath_;
    
    [[nodiscard]] bool isValidTicket(const std::filesystem::path& dir) const noexcept;
};

}
