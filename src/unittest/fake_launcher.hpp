/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "poolflow/accountant.hpp"
#include "poolflow/job.hpp"
#include "poolflow/process.hpp"

namespace poolflow {
namespace unittest {

// Launches nothing. Each launched job gets a handle whose exit the test
// decides through finish().
class FakeLauncher final : public ProcessLauncher {
public:
    struct Process {
        std::string label;
        Cost cost = 0;
        std::optional<ExitStatus> exit;
        int polls = 0;
    };

    std::unique_ptr<ProcessHandle> launch(const Command& command, Cost cost) override {
        std::string label = command.label();
        if (failing.count(label) > 0) {
            throw LaunchError("cannot execute " + label);
        }
        auto process = std::make_shared<Process>();
        process->label = label;
        process->cost = cost;
        launched.push_back(label);
        processes[label] = process;
        return std::make_unique<Handle>(process);
    }

    void finish(const std::string& label, ExitStatus status = ExitStatus::exited(0)) {
        processes.at(label)->exit = status;
    }

    bool running(const std::string& label) const {
        auto it = processes.find(label);
        return it != processes.end() && !it->second->exit;
    }

    std::vector<std::string> launched;
    std::set<std::string> failing;
    std::map<std::string, std::shared_ptr<Process>> processes;

private:
    class Handle final : public ProcessHandle {
    public:
        explicit Handle(std::shared_ptr<Process> process) : process_(std::move(process)) {}

        std::optional<ExitStatus> poll() override {
            ++process_->polls;
            return process_->exit;
        }
        std::string describe() const override { return "fake " + process_->label; }

    private:
        std::shared_ptr<Process> process_;
    };
};

// Bounded accountant that can be told to lose track of its allocations.
class LeakyAccountant final : public ResourceAccountant {
public:
    explicit LeakyAccountant(Cost capacity) : inner_(capacity) {}

    bool reserve(Cost cost) override { return inner_.reserve(cost); }
    void release(Cost cost) override {
        if (forget) {
            // Pretend the reservation was already given back.
            forget = false;
            inner_.release(inner_.allocated());
        }
        inner_.release(cost);
    }

    Cost capacity() const noexcept override { return inner_.capacity(); }
    Cost allocated() const noexcept override { return inner_.allocated(); }
    Cost available() const noexcept override { return inner_.available(); }
    bool enforcing() const noexcept override { return true; }

    bool forget = false;

private:
    BoundedAccountant inner_;
};

inline JobSpec fakeJob(const std::string& label, Cost cost) {
    JobSpec spec;
    spec.cost = cost;
    spec.command = Command::exec({label});
    return spec;
}

}
}
