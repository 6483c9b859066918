#include <catch2/catch_test_macros.hpp>

#include "backoff.hpp"

#include <algorithm>
#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("Backoff", "[backoff]") {
    Backoff backoff(1s, 30s);

    SECTION("StartsAtInitial") {
        REQUIRE(backoff.current() == 1s);
    }

    SECTION("DoublesUpToCap") {
        // After k failures the delay is min(2^k, 30) seconds.
        for (int k = 1; k <= 8; k++) {
            auto expected = std::chrono::seconds(std::min(1 << k, 30));
            REQUIRE(backoff.next() == expected);
            REQUIRE(backoff.current() == expected);
        }
    }

    SECTION("MonotonicNonDecreasing") {
        auto prev = backoff.current();
        for (int i = 0; i < 20; i++) {
            auto next = backoff.next();
            REQUIRE(next >= prev);
            REQUIRE(next <= 30s);
            prev = next;
        }
    }

    SECTION("ResetReturnsToInitial") {
        backoff.next();
        backoff.next();
        backoff.next();
        REQUIRE(backoff.current() == 8s);
        backoff.reset();
        REQUIRE(backoff.current() == 1s);
        REQUIRE(backoff.next() == 2s);
    }

    SECTION("CapBelowInitialIsRaised") {
        Backoff odd(5s, 2s);
        REQUIRE(odd.current() == 5s);
        REQUIRE(odd.next() == 5s);
    }
}
