/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for RetryPolicy
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "api/retry_policy.hpp"
#include "errors.hpp"

using namespace tabfetch;
using Catch::Matchers::WithinAbs;

TEST_CASE("RetrySpec defaults", "[retry_policy]") {
    RetrySpec spec;

    REQUIRE(spec.max_attempts == 5);
    REQUIRE(spec.statuses == std::set<long>{429, 500, 502, 503, 504});
    REQUIRE(spec.methods.count("GET") == 1);
    REQUIRE(spec.methods.count("POST") == 0);
    REQUIRE_THAT(spec.backoff_factor, WithinAbs(0.4, 1e-9));
}

TEST_CASE("RetryPolicy validation", "[retry_policy]") {
    SECTION("max_attempts below one is rejected") {
        RetrySpec spec;
        spec.max_attempts = 0;
        REQUIRE_THROWS_AS(RetryPolicy(spec), ConfigurationError);
    }

    SECTION("Negative backoff is rejected") {
        RetrySpec spec;
        spec.backoff_factor = -1.0;
        REQUIRE_THROWS_AS(RetryPolicy(spec), ConfigurationError);
    }

    SECTION("Method names are case-insensitive") {
        RetrySpec spec;
        spec.methods = {"get"};
        RetryPolicy policy(spec);
        REQUIRE(policy.is_retryable("GET", RetryOutcome::response(503)));
        REQUIRE(policy.is_retryable("get", RetryOutcome::response(503)));
    }
}

TEST_CASE("RetryPolicy decisions", "[retry_policy]") {
    RetrySpec spec;
    spec.max_attempts = 3;
    spec.jitter_fraction = 0.0;
    RetryPolicy policy(spec);

    SECTION("Retryable status is retried until max_attempts") {
        REQUIRE(policy.should_retry(1, "GET", RetryOutcome::response(503)).retry);
        REQUIRE(policy.should_retry(2, "GET", RetryOutcome::response(503)).retry);
        REQUIRE_FALSE(policy.should_retry(3, "GET", RetryOutcome::response(503)).retry);
    }

    SECTION("Non-retryable status is never retried") {
        REQUIRE_FALSE(policy.should_retry(1, "GET", RetryOutcome::response(404)).retry);
        REQUIRE_FALSE(policy.should_retry(1, "GET", RetryOutcome::response(200)).retry);
    }

    SECTION("Transport failures are retried") {
        REQUIRE(policy.should_retry(1, "GET", RetryOutcome::failure()).retry);
    }

    SECTION("POST is not in the default method set") {
        REQUIRE_FALSE(policy.should_retry(1, "POST", RetryOutcome::response(503)).retry);
        REQUIRE_FALSE(policy.should_retry(1, "POST", RetryOutcome::failure()).retry);
    }

    SECTION("Delays double per attempt") {
        REQUIRE_THAT(policy.should_retry(1, "GET", RetryOutcome::response(500)).delay_seconds,
                     WithinAbs(0.4, 1e-9));
        REQUIRE_THAT(policy.should_retry(2, "GET", RetryOutcome::response(500)).delay_seconds,
                     WithinAbs(0.8, 1e-9));
    }
}

TEST_CASE("RetryPolicy backoff bounds", "[retry_policy]") {
    SECTION("Delay is capped at max_backoff") {
        RetrySpec spec;
        spec.max_attempts = 100;
        spec.max_backoff = 10.0;
        RetryPolicy policy(spec);

        REQUIRE_THAT(policy.delay_for(50), WithinAbs(10.0, 1e-9));
        for (int attempt = 1; attempt < 100; ++attempt) {
            REQUIRE(policy.should_retry(attempt, "GET", RetryOutcome::failure()).delay_seconds <= 10.0);
        }
    }

    SECTION("Jitter stays within its fraction of the base delay") {
        RetrySpec spec;
        spec.backoff_factor = 1.0;
        spec.jitter_fraction = 0.5;
        RetryPolicy policy(spec);

        for (int i = 0; i < 50; ++i) {
            double delay = policy.should_retry(1, "GET", RetryOutcome::response(429)).delay_seconds;
            REQUIRE(delay >= 1.0);
            REQUIRE(delay <= 1.5);
        }
    }

    SECTION("Zero backoff factor retries immediately") {
        RetrySpec spec;
        spec.backoff_factor = 0.0;
        RetryPolicy policy(spec);

        RetryDecision decision = policy.should_retry(1, "GET", RetryOutcome::response(502));
        REQUIRE(decision.retry);
        REQUIRE(decision.delay_seconds == 0.0);
    }
}
