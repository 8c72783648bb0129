#include "api/retry_policy.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace tabfetch {

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

RetryPolicy::RetryPolicy(RetrySpec spec)
    : spec_(std::move(spec))
    , rng_(std::random_device{}())
{
    if (spec_.max_attempts < 1) {
        throw ConfigurationError("Retry max_attempts must be at least 1");
    }
    if (spec_.backoff_factor < 0.0 || spec_.max_backoff < 0.0 || spec_.jitter_fraction < 0.0) {
        throw ConfigurationError("Retry backoff values must not be negative");
    }

    std::set<std::string> methods;
    for (const auto& method : spec_.methods) {
        methods.insert(to_upper(method));
    }
    spec_.methods = std::move(methods);
}

bool RetryPolicy::is_retryable(const std::string& method, const RetryOutcome& outcome) const {
    if (spec_.methods.count(to_upper(method)) == 0) {
        return false;
    }
    if (outcome.transport_failure) {
        return true;
    }
    return spec_.statuses.count(outcome.status) > 0;
}

double RetryPolicy::delay_for(int attempt) const {
    if (attempt < 1) {
        return 0.0;
    }
    // Exponent is capped so the power cannot overflow for large attempt counts
    int exponent = std::min(attempt - 1, 30);
    double delay = spec_.backoff_factor * std::pow(2.0, exponent);
    return std::min(delay, spec_.max_backoff);
}

RetryDecision RetryPolicy::should_retry(int attempt, const std::string& method, const RetryOutcome& outcome) {
    if (!is_retryable(method, outcome) || attempt >= spec_.max_attempts) {
        return RetryDecision{false, 0.0};
    }

    double base = delay_for(attempt);
    double jitter = 0.0;
    if (base > 0.0 && spec_.jitter_fraction > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, base * spec_.jitter_fraction);
        jitter = dist(rng_);
    }
    return RetryDecision{true, std::min(base + jitter, spec_.max_backoff)};
}

} // namespace tabfetch
