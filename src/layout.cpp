/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"

namespace poolflow::layout {

bool create(const std::filesystem::path& root) noexcept {
    try {
        std::filesystem::create_directories(root / kWriting);
        std::filesystem::create_directories(root / kReady);
        std::filesystem::create_directories(root / kProcessing);
        std::filesystem::create_directories(root / kOutput);
        std::filesystem::create_directories(root / kFailed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool exists(const std::filesystem::path& root) noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(root / kReady, ec) &&
           std::filesystem::is_directory(root / kWriting, ec);
}

}
