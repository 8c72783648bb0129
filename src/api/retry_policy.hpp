/**
 * @file retry_policy.hpp
 * @brief Retry decision and exponential backoff for outbound requests
 */

#ifndef TABFETCH_API_RETRY_POLICY_HPP
#define TABFETCH_API_RETRY_POLICY_HPP

#include <random>
#include <set>
#include <string>

namespace tabfetch {

/**
 * @brief Retry configuration
 *
 * Only the listed methods are retried, and only for the listed statuses or
 * for transport failures. max_attempts counts every outbound call, the first
 * one included.
 */
struct RetrySpec {
    std::set<long> statuses{429, 500, 502, 503, 504};
    std::set<std::string> methods{"HEAD", "GET", "PUT", "OPTIONS", "DELETE", "TRACE"};
    int max_attempts = 5;
    double backoff_factor = 0.4;    ///< Seconds before the first retry
    double max_backoff = 120.0;     ///< Upper bound on any single delay (seconds)
    double jitter_fraction = 0.1;   ///< Random jitter added, as a fraction of the base delay
};

/**
 * @brief What happened on one attempt: a transport failure or an HTTP status
 */
struct RetryOutcome {
    bool transport_failure;
    long status;

    static RetryOutcome failure() { return RetryOutcome{true, 0}; }
    static RetryOutcome response(long status) { return RetryOutcome{false, status}; }
};

struct RetryDecision {
    bool retry;
    double delay_seconds;
};

class RetryPolicy {
public:
    /**
     * @throws ConfigurationError if max_attempts < 1 or a backoff value is negative
     */
    explicit RetryPolicy(RetrySpec spec = RetrySpec());

    /**
     * @brief Decide whether to issue another call after attempt number `attempt`
     *
     * @param attempt Number of calls made so far (1-based)
     * @param method HTTP method of the request
     * @param outcome Result of the last call
     */
    RetryDecision should_retry(int attempt, const std::string& method, const RetryOutcome& outcome);

    /**
     * @brief True if the outcome would be retried given enough attempts left
     */
    bool is_retryable(const std::string& method, const RetryOutcome& outcome) const;

    /**
     * @brief Un-jittered backoff before the retry following `attempt`
     *
     * Non-decreasing in attempt and capped at max_backoff.
     */
    double delay_for(int attempt) const;

    const RetrySpec& spec() const { return spec_; }

private:
    RetrySpec spec_;
    std::minstd_rand rng_;
};

} // namespace tabfetch

#endif // TABFETCH_API_RETRY_POLICY_HPP
