/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>

#include "poolflow/types.hpp"

// Workspace layout shared by the daemon and the command-line tools:
//
//   input/writing/<id>/   ticket being written by a submitter
//   input/ready/<id>/     published, waiting for the daemon
//   processing/<id>/      claimed and handed to the pool
//   output/<id>/          exited successfully
//   failed/<id>/          failed, rejected or orphaned (see error.txt)
//
// A ticket holds cost.txt (bytes), argv (NUL-terminated arguments) and,
// once finished, exit.txt and output.log.
namespace poolflow::layout {

inline constexpr const char* kWriting = "input/writing";
inline constexpr const char* kReady = "input/ready";
inline constexpr const char* kProcessing = "processing";
inline constexpr const char* kOutput = "output";
inline constexpr const char* kFailed = "failed";

inline constexpr const char* kCostFile = "cost.txt";
inline constexpr const char* kArgvFile = "argv";
inline constexpr const char* kLabelFile = "label.txt";
inline constexpr const char* kExitFile = "exit.txt";
inline constexpr const char* kErrorFile = "error.txt";
inline constexpr const char* kOutputLog = "output.log";
inline constexpr const char* kPidFile = ".poolflowd.pid";

[[nodiscard]] bool create(const std::filesystem::path& root) noexcept;
[[nodiscard]] bool exists(const std::filesystem::path& root) noexcept;

[[nodiscard]] inline std::filesystem::path ticketPath(const std::filesystem::path& root, const char* phase,
                                                      const TicketId& id) {
    return root / phase / id;
}

}
