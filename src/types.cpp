/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/types.hpp"

namespace poolflow {

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Pending: return "PENDING";
        case JobState::Running: return "RUNNING";
        case JobState::Completed: return "COMPLETED";
        case JobState::Failed: return "FAILED";
        case JobState::Rejected: return "REJECTED";
        default: return "UNKNOWN";
    }
}

const char* toString(PoolMode mode) noexcept {
    switch (mode) {
        case PoolMode::Static: return "static";
        case PoolMode::Dynamic: return "dynamic";
        default: return "unknown";
    }
}

const char* toString(Lifecycle lifecycle) noexcept {
    switch (lifecycle) {
        case Lifecycle::Idle: return "IDLE";
        case Lifecycle::Active: return "ACTIVE";
        case Lifecycle::Draining: return "DRAINING";
        case Lifecycle::Terminated: return "TERMINATED";
        default: return "UNKNOWN";
    }
}

const char* toString(TicketStatus status) noexcept {
    switch (status) {
        case TicketStatus::Queued: return "QUEUED";
        case TicketStatus::Running: return "RUNNING";
        case TicketStatus::Done: return "DONE";
        case TicketStatus::Failed: return "FAILED";
        case TicketStatus::Missing: return "MISSING";
        default: return "UNKNOWN";
    }
}

const char* toString(SubmitError error) noexcept {
    switch (error) {
        case SubmitError::None: return "none";
        case SubmitError::CostExceedsCapacity: return "cost exceeds capacity";
        case SubmitError::PoolClosed: return "pool closed";
        case SubmitError::NotAccepting: return "pool does not accept submissions";
        case SubmitError::InvalidCommand: return "invalid command";
        case SubmitError::IoError: return "I/O error";
        case SubmitError::InvalidSize: return "invalid size";
        case SubmitError::WorkspaceError: return "workspace error";
        default: return "unknown";
    }
}

}
