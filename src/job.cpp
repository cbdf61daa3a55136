/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/job.hpp"
#include <ctime>

namespace poolflow {

Job::Job(JobId id, JobSpec spec)
    : id(id),
      cost(spec.cost),
      command(std::move(spec.command)),
      preHook(std::move(spec.preHook)),
      postHook(std::move(spec.postHook)),
      label(std::move(spec.label)),
      submitted(Clock::now()) {
    if (label.empty()) {
        label = command.label();
    }
}

JobRecord Job::record() const {
    JobRecord rec;
    rec.id = id;
    rec.label = label;
    rec.cost = cost;
    rec.state = state;
    rec.exit = exit;
    rec.submitted = submitted;
    rec.started = started;
    rec.finished = finished;
    return rec;
}

std::optional<std::chrono::milliseconds> JobRecord::runningTime() const {
    if (!started || !finished) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*finished - *started);
}

std::string formatTime(Clock::time_point tp) {
    auto time = Clock::to_time_t(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%d/%m/%y-%H:%M:%S", std::localtime(&time));
    return buf;
}

}
