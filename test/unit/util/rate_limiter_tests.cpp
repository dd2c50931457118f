// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for logging rate limiter

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

using namespace shardnet::util;

TEST_CASE("RateLimiter: burst capacity", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N messages allowed") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("test:1", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
    }

    SECTION("Callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("test:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("test:1", 200, 3600));
        REQUIRE(limiter.should_log("test:2", 200, 3600));
    }
}

TEST_CASE("RateLimiter: refill over time", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("One token per tenth of the period") {
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("test:refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("test:refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));
    }

    SECTION("Refill caps at burst size") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("test:cap", 5, 1);
        }

        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("test:cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("test:cap", 5, 1));
    }
}

TEST_CASE("RateLimiter: announcement spam", "[rate_limiter]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;

    // A peer flooding bad announcements gets a bounded number of log lines
    int logged = 0;
    for (int i = 0; i < 5000; ++i) {
        if (limiter.should_log("announce_account_cache.cpp:34", 200, 3600)) {
            logged++;
        }
    }
    REQUIRE(logged == 200);

    // After a full period the bucket is full again
    SetMockTime(2000000 + 3600);
    logged = 0;
    for (int i = 0; i < 5000; ++i) {
        if (limiter.should_log("announce_account_cache.cpp:34", 200, 3600)) {
            logged++;
        }
    }
    REQUIRE(logged == 200);
}
