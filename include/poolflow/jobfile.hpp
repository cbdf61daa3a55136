/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "poolflow/job.hpp"

namespace poolflow {

class JobFileError : public std::runtime_error {
public:
    JobFileError(std::size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

// Splits on whitespace; double quotes group, backslash escapes inside quotes.
[[nodiscard]] std::vector<std::string> splitArgs(const std::string& text);

// One job per line: "<cost> <program> [args...]". Blank lines and lines
// starting with '#' are skipped.
[[nodiscard]] std::vector<JobSpec> parseJobList(const std::vector<std::string>& lines);
[[nodiscard]] std::vector<JobSpec> loadJobFile(const std::filesystem::path& path);

}
