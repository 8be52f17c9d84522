#pragma once
#include "clock.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace aiu {

struct RateLimiterOptions {
    double capacity = 1;     // maximum tokens in the bucket
    double refill_rate = 1;  // tokens added per second
    std::optional<double> initial_tokens; // defaults to capacity
};

// Token bucket. Tokens are refilled lazily from elapsed clock time on every
// access, so no background task is needed. All operations are thread-safe.
class RateLimiter {
public:
    explicit RateLimiter(const RateLimiterOptions& options,
                         Clock& clock = default_clock());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Consume `tokens` if available. A failed attempt leaves the bucket as is.
    // Negative counts throw std::invalid_argument.
    bool try_consume(double tokens = 1);

    // Block until `tokens` can be consumed, then consume them.
    // Returns false (nothing consumed) if abort_flag becomes true while waiting.
    // There is no timeout: a low refill rate can block for a long time.
    bool consume(double tokens = 1, const std::atomic<bool>* abort_flag = nullptr);

    double available_tokens();

    // Milliseconds until `tokens` will be available (0 if available now)
    double time_until_tokens(double tokens);

    // Refill to capacity and restart the refill clock
    void reset();

    double capacity() const { return capacity_; }
    double refill_rate() const { return refill_rate_; }

private:
    void refill_locked();
    double time_until_locked(double tokens) const;

    const double capacity_;
    const double refill_rate_;
    Clock& clock_;

    std::mutex mutex_;
    double tokens_;
    double last_refill_ms_;
};

// Independent token buckets per key, created lazily with shared options.
class KeyedRateLimiter {
public:
    explicit KeyedRateLimiter(const RateLimiterOptions& options,
                              Clock& clock = default_clock());

    bool consume(const std::string& key, double tokens = 1,
                 const std::atomic<bool>* abort_flag = nullptr);
    bool try_consume(const std::string& key, double tokens = 1);
    double available_tokens(const std::string& key);
    double time_until_tokens(const std::string& key, double tokens);

    // Drop the bucket for `key`; the next use starts from a fresh, full bucket.
    void reset(const std::string& key);
    void reset_all();

    // Number of keys currently tracked
    size_t size() const;

    const RateLimiterOptions& options() const { return options_; }

private:
    std::shared_ptr<RateLimiter> limiter_for(const std::string& key);

    const RateLimiterOptions options_;
    Clock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RateLimiter>> limiters_;
};

} // namespace aiu
