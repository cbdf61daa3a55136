#pragma once
#include <cstdint>
#include <limits>
#include <string>

namespace poolflow {

// Pool-assigned job identifier, unique per pool and increasing with submission order.
using JobId = std::uint64_t;

// Memory amounts in bytes.
using Cost = std::uint64_t;

inline constexpr Cost kUnbounded = std::numeric_limits<Cost>::max();

// Core job lifecycle states.
enum class JobState : std::uint8_t { Pending, Running, Completed, Failed, Rejected };

enum class PoolMode : std::uint8_t { Static, Dynamic };

enum class Lifecycle : std::uint8_t { Idle, Active, Draining, Terminated };

// Workspace ticket states, as seen from the directory layout.
enum class TicketStatus : std::uint8_t { Queued, Running, Done, Failed, Missing };

// Workspace ticket identifier (directory name).
using TicketId = std::string;

enum class SubmitError : std::uint8_t {
    None = 0,
    CostExceedsCapacity,
    PoolClosed,
    NotAccepting,
    InvalidCommand,
    IoError,
    InvalidSize,
    WorkspaceError
};

const char* toString(JobState state) noexcept;
const char* toString(PoolMode mode) noexcept;
const char* toString(Lifecycle lifecycle) noexcept;
const char* toString(TicketStatus status) noexcept;
const char* toString(SubmitError error) noexcept;

} // namespace poolflow
