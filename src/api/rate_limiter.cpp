#include "api/rate_limiter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>
#include <thread>

namespace tabfetch {

RateLimiter::RateLimiter(std::optional<RateLimitSpec> spec, SleepFunction sleep)
    : spec_(spec)
    , interval_(Clock::duration::zero())
    , sleep_(std::move(sleep))
{
    if (spec_) {
        if (spec_->calls <= 0) {
            throw ConfigurationError("Rate limit calls must be positive, got " +
                                     std::to_string(spec_->calls));
        }
        if (spec_->period < 0.0) {
            throw ConfigurationError("Rate limit period must not be negative");
        }
        interval_ = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(spec_->period / spec_->calls));
    }

    if (!sleep_) {
        sleep_ = [](Clock::duration d) { std::this_thread::sleep_for(d); };
    }
}

void RateLimiter::acquire() {
    if (!spec_) {
        return;
    }

    auto now = Clock::now();
    if (last_) {
        auto ready_at = *last_ + interval_;
        if (now < ready_at) {
            sleep_(ready_at - now);
            // An injected sleep may return early; the slot is still ready_at
            now = std::max(Clock::now(), ready_at);
        }
    }

    last_ = now;
}

} // namespace tabfetch
