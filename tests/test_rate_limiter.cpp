/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for RateLimiter
 */

#include <catch2/catch_test_macros.hpp>
#include "api/rate_limiter.hpp"
#include "errors.hpp"
#include <chrono>
#include <thread>
#include <vector>

using namespace tabfetch;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter configuration", "[rate_limiter]") {
    SECTION("Unconfigured limiter never sleeps") {
        int sleeps = 0;
        RateLimiter limiter(std::nullopt, [&](RateLimiter::Clock::duration) { ++sleeps; });

        REQUIRE_FALSE(limiter.enabled());
        for (int i = 0; i < 5; ++i) {
            limiter.acquire();
        }
        REQUIRE(sleeps == 0);
    }

    SECTION("Interval is period divided by calls") {
        RateLimiter limiter(RateLimitSpec{4, 2.0});
        REQUIRE(limiter.enabled());
        REQUIRE(limiter.interval() == std::chrono::duration_cast<RateLimiter::Clock::duration>(500ms));
    }

    SECTION("Zero calls is rejected") {
        REQUIRE_THROWS_AS(RateLimiter(RateLimitSpec{0, 1.0}), ConfigurationError);
    }

    SECTION("Negative period is rejected") {
        REQUIRE_THROWS_AS(RateLimiter(RateLimitSpec{1, -1.0}), ConfigurationError);
    }
}

TEST_CASE("RateLimiter spacing", "[rate_limiter]") {
    SECTION("First call does not wait") {
        std::vector<RateLimiter::Clock::duration> sleeps;
        RateLimiter limiter(RateLimitSpec{1, 10.0}, [&](RateLimiter::Clock::duration d) { sleeps.push_back(d); });

        limiter.acquire();
        REQUIRE(sleeps.empty());
    }

    SECTION("Back-to-back calls request a sleep of about one interval") {
        std::vector<RateLimiter::Clock::duration> sleeps;
        RateLimiter limiter(RateLimitSpec{1, 10.0}, [&](RateLimiter::Clock::duration d) { sleeps.push_back(d); });

        limiter.acquire();
        limiter.acquire();
        REQUIRE(sleeps.size() == 1);
        REQUIRE(sleeps[0] > 9s);
        REQUIRE(sleeps[0] <= 10s);
    }

    SECTION("Three calls at one per 0.1 s take at least 0.2 s") {
        RateLimiter limiter(RateLimitSpec{1, 0.1});

        auto start = std::chrono::steady_clock::now();
        limiter.acquire();
        limiter.acquire();
        limiter.acquire();
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(elapsed >= 200ms);
    }

    SECTION("No sleep when the interval has already passed") {
        int sleeps = 0;
        RateLimiter limiter(RateLimitSpec{1, 0.01}, [&](RateLimiter::Clock::duration) { ++sleeps; });

        limiter.acquire();
        std::this_thread::sleep_for(30ms);
        limiter.acquire();
        REQUIRE(sleeps == 0);
    }
}
