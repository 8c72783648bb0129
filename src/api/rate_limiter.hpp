/**
 * @file rate_limiter.hpp
 * @brief Minimum-interval throttle for outbound calls
 */

#ifndef TABFETCH_API_RATE_LIMITER_HPP
#define TABFETCH_API_RATE_LIMITER_HPP

#include <chrono>
#include <functional>
#include <optional>

namespace tabfetch {

/**
 * @brief At most `calls` outbound calls per `period` seconds
 */
struct RateLimitSpec {
    int calls = 1;
    double period = 1.0;
};

/**
 * @brief Spaces successive acquire() calls at least period / calls apart
 *
 * An unconfigured limiter never blocks. The sleep function is injectable so
 * tests can observe requested delays without waiting.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using SleepFunction = std::function<void(Clock::duration)>;

    /**
     * @throws ConfigurationError if calls <= 0 or period < 0
     */
    explicit RateLimiter(std::optional<RateLimitSpec> spec = std::nullopt,
                         SleepFunction sleep = SleepFunction());

    /**
     * @brief Block until the next call is allowed
     */
    void acquire();

    bool enabled() const { return spec_.has_value(); }
    Clock::duration interval() const { return interval_; }

private:
    std::optional<RateLimitSpec> spec_;
    Clock::duration interval_;
    SleepFunction sleep_;
    std::optional<Clock::time_point> last_;
};

} // namespace tabfetch

#endif // TABFETCH_API_RATE_LIMITER_HPP
