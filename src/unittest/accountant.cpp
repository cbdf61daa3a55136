/*
 * poolflow - Memory-Budgeted Job Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "poolflow/accountant.hpp"

namespace poolflow {
namespace unittest {

TEST_CASE("Bounded accountant reserves only what fits", "[accountant]") {
    BoundedAccountant accountant(1000);

    REQUIRE(accountant.reserve(600));
    REQUIRE(accountant.allocated() == 600);
    REQUIRE(accountant.available() == 400);

    SECTION("A reservation larger than what is left changes nothing") {
        REQUIRE_FALSE(accountant.reserve(401));
        REQUIRE(accountant.allocated() == 600);
    }

    SECTION("The remaining budget can be reserved exactly") {
        REQUIRE(accountant.reserve(400));
        REQUIRE(accountant.available() == 0);
        REQUIRE_FALSE(accountant.reserve(1));
        REQUIRE(accountant.reserve(0));
    }

    SECTION("Released budget becomes available again") {
        accountant.release(600);
        REQUIRE(accountant.allocated() == 0);
        REQUIRE(accountant.reserve(1000));
    }
}

TEST_CASE("Bounded accountant refuses to release more than allocated", "[accountant]") {
    BoundedAccountant accountant(100);
    REQUIRE(accountant.reserve(50));

    REQUIRE_THROWS_AS(accountant.release(51), AccountingError);
    // Nothing changed
    REQUIRE(accountant.allocated() == 50);

    accountant.release(50);
    REQUIRE_THROWS_AS(accountant.release(50), AccountingError);
}

TEST_CASE("Admissibility compares against the whole capacity", "[accountant]") {
    BoundedAccountant accountant(1000);
    REQUIRE(accountant.reserve(1000));

    REQUIRE(accountant.admissible(1000));
    REQUIRE_FALSE(accountant.admissible(1001));
    REQUIRE(accountant.enforcing());
}

TEST_CASE("Unbounded accountant admits everything but still checks releases", "[accountant]") {
    UnboundedAccountant accountant;

    REQUIRE_FALSE(accountant.enforcing());
    REQUIRE(accountant.capacity() == kUnbounded);
    REQUIRE(accountant.available() == kUnbounded);

    REQUIRE(accountant.reserve(kUnbounded - 1));
    REQUIRE(accountant.reserve(10));
    REQUIRE(accountant.allocated() == kUnbounded);

    UnboundedAccountant fresh;
    REQUIRE(fresh.reserve(20));
    fresh.release(20);
    REQUIRE_THROWS_AS(fresh.release(1), AccountingError);
}

TEST_CASE("An explicit capacity always gives a bounded accountant", "[accountant]") {
    auto accountant = makeAccountant(Cost(4096));
    REQUIRE(accountant->enforcing());
    REQUIRE(accountant->capacity() == 4096);
    REQUIRE(accountant->allocated() == 0);
}

TEST_CASE("Detected capacity is used when none is given", "[accountant]") {
    auto detected = detectAvailableMemory();
    auto accountant = makeAccountant(std::nullopt);

    if (detected) {
        REQUIRE(accountant->enforcing());
        REQUIRE(accountant->capacity() > 0);
    } else {
        REQUIRE_FALSE(accountant->enforcing());
    }
}

}
}
