/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "poolflow/jobfile.hpp"
#include "poolflow/config.hpp"
#include "poolflow/logger.hpp"
#include <cctype>
#include <fstream>

namespace poolflow {

std::vector<std::string> splitArgs(const std::string& text) {
    std::vector<std::string> args;
    std::string current;
    bool inToken = false;
    bool quoted = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (quoted) {
            if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
                current += text[++i];
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
            continue;
        }

        if (c == '"') {
            quoted = true;
            inToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inToken) {
                args.push_back(current);
                current.clear();
                inToken = false;
            }
        } else {
            current += c;
            inToken = true;
        }
    }

    if (quoted) {
        throw std::invalid_argument("unterminated quote");
    }
    if (inToken) {
        args.push_back(current);
    }
    return args;
}

std::vector<JobSpec> parseJobList(const std::vector<std::string>& lines) {
    std::vector<JobSpec> jobs;

    for (std::size_t n = 0; n < lines.size(); ++n) {
        const std::string& line = lines[n];
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        try {
            fields = splitArgs(line);
        } catch (const std::invalid_argument& e) {
            throw JobFileError(n + 1, e.what());
        }

        if (fields.size() < 2) {
            throw JobFileError(n + 1, "expected '<cost> <program> [args...]'");
        }

        auto cost = parseSize(fields[0]);
        if (!cost) {
            throw JobFileError(n + 1, "invalid cost '" + fields[0] + "'");
        }

        JobSpec spec;
        spec.cost = *cost;
        spec.command = Command::exec(std::vector<std::string>(fields.begin() + 1, fields.end()));
        jobs.push_back(std::move(spec));
    }

    LOG_DEBUG("Parsed " + std::to_string(jobs.size()) + " job(s)");
    return jobs;
}

std::vector<JobSpec> loadJobFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open job file: " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return parseJobList(lines);
}

}
