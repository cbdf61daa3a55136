/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "poolflow/types.hpp"

namespace poolflow {

// Raised when a release would drive the allocated amount below zero.
// This is a bookkeeping bug (double release, mis-tracked cost), not a
// runtime condition, and is fatal to the pool that owns the accountant.
class AccountingError : public std::logic_error {
public:
    explicit AccountingError(const std::string& what) : std::logic_error(what) {}
};

// Tracks a memory budget shared by all running jobs of one pool.
class ResourceAccountant {
public:
    virtual ~ResourceAccountant() = default;

    // Adds cost to the allocated amount if it fits; no change otherwise.
    [[nodiscard]] virtual bool reserve(Cost cost) = 0;
    // Throws AccountingError on underflow.
    virtual void release(Cost cost) = 0;

    [[nodiscard]] virtual Cost capacity() const noexcept = 0;
    [[nodiscard]] virtual Cost allocated() const noexcept = 0;
    [[nodiscard]] virtual Cost available() const noexcept = 0;

    // False when the budget is not enforced (capacity reported as kUnbounded).
    [[nodiscard]] virtual bool enforcing() const noexcept = 0;

    [[nodiscard]] bool admissible(Cost cost) const noexcept { return cost <= capacity(); }
};

class BoundedAccountant final : public ResourceAccountant {
public:
    explicit BoundedAccountant(Cost capacity) noexcept;

    BoundedAccountant(const BoundedAccountant&) = delete;
    BoundedAccountant& operator=(const BoundedAccountant&) = delete;

    [[nodiscard]] bool reserve(Cost cost) override;
    void release(Cost cost) override;

    [[nodiscard]] Cost capacity() const noexcept override { return capacity_; }
    [[nodiscard]] Cost allocated() const noexcept override;
    [[nodiscard]] Cost available() const noexcept override;
    [[nodiscard]] bool enforcing() const noexcept override { return true; }

private:
    const Cost capacity_;
    Cost allocated_ = 0;
    mutable std::mutex mutex_;
};

// Degraded mode: every reservation succeeds. Allocations are still tracked so
// that releases are checked and status stays meaningful.
class UnboundedAccountant final : public ResourceAccountant {
public:
    UnboundedAccountant() noexcept = default;

    UnboundedAccountant(const UnboundedAccountant&) = delete;
    UnboundedAccountant& operator=(const UnboundedAccountant&) = delete;

    [[nodiscard]] bool reserve(Cost cost) override;
    void release(Cost cost) override;

    [[nodiscard]] Cost capacity() const noexcept override { return kUnbounded; }
    [[nodiscard]] Cost allocated() const noexcept override;
    [[nodiscard]] Cost available() const noexcept override { return kUnbounded; }
    [[nodiscard]] bool enforcing() const noexcept override { return false; }

private:
    Cost allocated_ = 0;
    mutable std::mutex mutex_;
};

// Available memory as reported by the OS, or nullopt when it cannot be queried.
[[nodiscard]] std::optional<Cost> detectAvailableMemory() noexcept;

// An explicit capacity always yields a BoundedAccountant. Without one, the
// detected available memory is used; if detection fails the accountant
// degrades to UnboundedAccountant and says so in the log.
[[nodiscard]] std::unique_ptr<ResourceAccountant> makeAccountant(std::optional<Cost> capacity);

}
