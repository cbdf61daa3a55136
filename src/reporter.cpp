/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/reporter.hpp"
#include "poolflow/config.hpp"
#include "poolflow/logger.hpp"
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace poolflow {

namespace {
std::string clip(const std::string& text, std::size_t width) {
    if (text.size() <= width) {
        return text;
    }
    return text.substr(0, width - 3) + "...";
}

std::string memoryLine(const Snapshot& snapshot) {
    std::ostringstream oss;
    oss << "Memory: allocated " << formatSize(snapshot.allocated);
    if (snapshot.enforced) {
        oss << " of " << formatSize(snapshot.capacity)
            << " (" << formatSize(snapshot.capacity - snapshot.allocated) << " available)";
    } else {
        oss << ", capacity unbounded (budget NOT enforced)";
    }
    return oss.str();
}

const char* memoryStatus(const JobRecord& record) {
    if (!record.started) {
        return "Never allocated";
    }
    return "Released";
}

std::string runningTime(const JobRecord& record) {
    auto elapsed = record.runningTime();
    if (!elapsed) {
        return "/";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (static_cast<double>(elapsed->count()) / 1000.0) << "s";
    return oss.str();
}

void writeStatus(std::ostream& out, const Snapshot& snapshot) {
    out << "Pool status - " << formatTime(snapshot.taken)
        << "  [" << toString(snapshot.mode) << ", " << toString(snapshot.lifecycle)
        << (snapshot.closed ? ", closed" : "")
        << (snapshot.faulted ? ", FAULTED" : "") << "]\n";
    out << "Jobs running: " << snapshot.running.size()
        << "   queued: " << snapshot.pendingCount
        << "   completed: " << snapshot.completed
        << "   failed: " << snapshot.failed
        << "   rejected: " << snapshot.rejected << "\n";

    if (!snapshot.running.empty()) {
        out << "  " << std::left << std::setw(8) << "Id"
            << std::setw(12) << "Cost"
            << std::setw(40) << "Target"
            << "Start" << "\n";
        for (const auto& job : snapshot.running) {
            out << "  " << std::left << std::setw(8) << job.id
                << std::setw(12) << formatSize(job.cost)
                << std::setw(40) << clip(job.label, 38)
                << formatTime(job.started) << "\n";
        }
    }

    out << memoryLine(snapshot) << "\n";
}

void writeReview(std::ostream& out, const std::vector<JobRecord>& records) {
    out << "Pool review\n";
    out << "  " << std::left << std::setw(8) << "Id"
        << std::setw(11) << "State"
        << std::setw(17) << "Memory Status"
        << std::setw(12) << "Cost"
        << std::setw(32) << "Target"
        << std::setw(19) << "Start"
        << std::setw(19) << "End"
        << "Running Time" << "\n";
    for (const auto& record : records) {
        out << "  " << std::left << std::setw(8) << record.id
            << std::setw(11) << toString(record.state)
            << std::setw(17) << memoryStatus(record)
            << std::setw(12) << formatSize(record.cost)
            << std::setw(32) << clip(record.label, 30)
            << std::setw(19) << (record.started ? formatTime(*record.started) : "/")
            << std::setw(19) << (record.finished ? formatTime(*record.finished) : "/")
            << runningTime(record) << "\n";
    }
}
}

void TableReporter::report(const Snapshot& snapshot) {
    writeStatus(out_, snapshot);
    out_ << std::endl;
}

void TableReporter::finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) {
    writeStatus(out_, snapshot);
    out_ << "\n";
    review(records);
    out_ << "End of pool - " << formatTime(Clock::now()) << std::endl;
}

void TableReporter::review(const std::vector<JobRecord>& records) {
    writeReview(out_, records);
}

FileReporter::FileReporter(std::filesystem::path path) : path_(std::move(path)) {
    LOG_DEBUG("Status file: " + path_.string());
}

void FileReporter::report(const Snapshot& snapshot) {
    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
        LOG_WARN("Cannot write status file: " + path_.string());
        return;
    }
    writeStatus(file, snapshot);
}

void FileReporter::finished(const Snapshot& snapshot, const std::vector<JobRecord>& records) {
    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
        LOG_WARN("Cannot write status file: " + path_.string());
        return;
    }
    writeStatus(file, snapshot);
    file << "\n";
    writeReview(file, records);
}

}
