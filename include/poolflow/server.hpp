/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

#include "poolflow/config.hpp"
#include "poolflow/types.hpp"

namespace poolflow {

class Scanner;
class Pool;
class Processor;

// Daemon side of a workspace: feeds published tickets into a dynamic pool.
class Server final {
public:
    explicit Server(const std::filesystem::path& workspace, PoolConfig config = PoolConfig());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    // Stops taking tickets, then waits for running jobs to exit.
    void shutdown() noexcept;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    // False once shut down or once the pool has stopped on its own (fault).
    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] const Pool* pool() const noexcept { return pool_.get(); }

private:
    void scanLoop();
    void feed(const TicketId& id);

    std::filesystem::path workspace_;
    PoolConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    // Jobs hold hooks into the processor: pool_ is destroyed first.
    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Pool> pool_;

    std::thread scannerThread_;
};

}
