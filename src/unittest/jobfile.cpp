/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/jobfile.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace poolflow {
namespace unittest {

using std::string;
using std::vector;

TEST_CASE("Arguments split on whitespace and group on quotes", "[jobfile]") {
    REQUIRE(splitArgs("a  b\tc") == vector<string>{"a", "b", "c"});
    REQUIRE(splitArgs("run \"two words\" x") == vector<string>{"run", "two words", "x"});
    REQUIRE(splitArgs("echo \"say \\\"hi\\\"\"") == vector<string>{"echo", "say \"hi\""});
    REQUIRE(splitArgs("empty \"\"") == vector<string>{"empty", ""});
    REQUIRE(splitArgs("  ").empty());
    REQUIRE_THROWS_AS(splitArgs("broken \"quote"), std::invalid_argument);
}

TEST_CASE("Job lists hold one job per line", "[jobfile]") {
    vector<string> lines{
        "# nightly batch",
        "",
        "2G ./simulate --steps 100",
        "   ",
        "512M sort \"big file.txt\"",
    };

    auto jobs = parseJobList(lines);
    REQUIRE(jobs.size() == 2);

    REQUIRE(jobs[0].cost == Cost(2) * 1024 * 1024 * 1024);
    REQUIRE(jobs[0].command.argv == vector<string>{"./simulate", "--steps", "100"});
    REQUIRE(jobs[0].command.valid());

    REQUIRE(jobs[1].cost == Cost(512) * 1024 * 1024);
    REQUIRE(jobs[1].command.argv == vector<string>{"sort", "big file.txt"});
}

TEST_CASE("Job list errors name the offending line", "[jobfile]") {
    SECTION("Missing program") {
        try {
            (void)parseJobList({"# header", "100"});
            FAIL("expected a JobFileError");
        } catch (const JobFileError& e) {
            REQUIRE(e.line() == 2);
        }
    }

    SECTION("Bad cost") {
        REQUIRE_THROWS_AS(parseJobList({"lots ./run"}), JobFileError);
    }

    SECTION("Unterminated quote") {
        REQUIRE_THROWS_WITH(parseJobList({"1K echo \"oops"}), Catch::Contains("line 1"));
    }
}

TEST_CASE("Job files are read from disk", "[jobfile]") {
    auto path = std::filesystem::temp_directory_path() / ("poolflow_jobs_" + std::to_string(getpid()) + ".txt");
    {
        std::ofstream file(path);
        file << "1K true\n";
        file << "# skipped\n";
        file << "2K false\n";
    }

    auto jobs = loadJobFile(path);
    std::filesystem::remove(path);

    REQUIRE(jobs.size() == 2);
    REQUIRE(jobs[1].command.label() == "false");

    REQUIRE_THROWS(loadJobFile(path));
}

}
}
