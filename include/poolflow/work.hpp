/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "poolflow/types.hpp"

namespace poolflow {

struct TicketResult {
    bool ok = false;
    TicketId id;
    SubmitError error = SubmitError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Writes job tickets into a workspace for a running daemon to pick up.
class Work final {
public:
    explicit Work(const std::filesystem::path& workspace, bool createIfMissing = true);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) noexcept = default;
    Work& operator=(Work&&) noexcept = default;

    [[nodiscard]] TicketResult submit(Cost cost, const std::vector<std::string>& argv,
                                      const std::string& label = "");

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

private:
    std::filesystem::path workspace_;
    std::size_t maxBytes_ = 1'000'000; // total argv bytes

    [[nodiscard]] static TicketId generateId();
    [[nodiscard]] bool writeTicket(const TicketId& id, Cost cost, const std::vector<std::string>& argv,
                                   const std::string& label) const noexcept;
    [[nodiscard]] bool atomicPublish(const TicketId& id) const noexcept;
    void cleanupFailedTicket(const TicketId& id) const noexcept;
};

}
