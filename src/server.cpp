/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/server.hpp"
#include "poolflow/layout.hpp"
#include "poolflow/logger.hpp"
#include "poolflow/pool.hpp"
#include "poolflow/processor.hpp"
#include "poolflow/reporter.hpp"
#include "poolflow/scanner.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace poolflow {

// Note: Signal handling is done by the CLI (poolflowd.cpp), not by Server class

Server::Server(const std::filesystem::path& workspace, PoolConfig config)
    : workspace_(workspace), config_(std::move(config)) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string());
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting poolflow daemon...");

    if (!layout::create(workspace_)) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("poolflow Daemon Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Capacity: " + (config_.capacity ? formatSize(*config_.capacity) : std::string("detect")));
    LOG_DEBUG("Tick: " + std::to_string(config_.tickInterval.count()) + " ms");
    LOG_DEBUG("Memory limit: " + std::string(toString(config_.limits)));
    LOG_DEBUG("Log Level: " + std::string(getenv("POOLFLOW_LOG_LEVEL") ? getenv("POOLFLOW_LOG_LEVEL") : "INFO"));
    LOG_DEBUG("========================================");

    try {
        scanner_ = std::make_unique<Scanner>(workspace_);
        processor_ = std::make_unique<Processor>(workspace_);

        auto orphans = processor_->failOrphans();
        if (orphans > 0) {
            LOG_WARN("Moved " + std::to_string(orphans) + " orphaned ticket(s) to failed");
        }

        pool_ = Pool::create(PoolMode::Dynamic, config_);
        if (config_.statusFile.empty()) {
            pool_->setReporter(std::make_shared<TableReporter>(std::cout));
        } else {
            pool_->setReporter(std::make_shared<FileReporter>(config_.statusFile));
        }

        if (!pool_->start()) {
            LOG_ERROR("Failed to start scheduling loop");
            return false;
        }

        running_.store(true);
        shutdown_.store(false);

        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        pool_.reset();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down daemon...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    if (pool_) {
        try {
            pool_->end();
            auto running = pool_->snapshot().running.size();
            if (running > 0) {
                LOG_INFO("Waiting for " + std::to_string(running) + " running job(s) to exit");
            }
            pool_->wait();
        } catch (const std::exception& e) {
            LOG_ERROR("Error while draining pool: " + std::string(e.what()));
        }
    }

    pool_.reset();
    processor_.reset();
    scanner_.reset();

    LOG_INFO("Daemon shutdown complete");
}

bool Server::isRunning() const noexcept {
    return running_.load() && pool_ && pool_->isRunning();
}

void Server::feed(const TicketId& id) {
    auto spec = processor_->claim(id);
    if (!spec) {
        return;
    }

    auto result = pool_->submit(std::move(*spec));
    if (!result) {
        // Rejected jobs never ran, so their hooks never fire.
        (void)processor_->reject(id, std::string(toString(result.error)) + ": " + result.message);
        return;
    }
    LOG_DEBUG("Ticket " + id + " submitted as job " + std::to_string(result.id));
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    const auto scanInterval = config_.tickInterval;

    while (!shutdown_.load()) {
        try {
            auto tickets = scanner_->scan();
            for (const auto& id : tickets) {
                if (shutdown_.load()) break;
                feed(id);
            }

            if (!tickets.empty()) {
                LOG_DEBUG("Fed " + std::to_string(tickets.size()) + " ticket(s) to pool");
            }

            auto sleepEnd = std::chrono::steady_clock::now() + scanInterval;
            while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
                std::this_thread::sleep_for(std::min(scanInterval, std::chrono::milliseconds(100)));
            }

        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(scanInterval);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
