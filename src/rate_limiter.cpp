#include "rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace aiu {

// Longest single wait when an abort flag is being watched
static constexpr double ABORT_POLL_MS = 1000;

static void validate_options(const RateLimiterOptions& options) {
    if (!(options.capacity > 0))
        throw std::invalid_argument("RateLimiter: capacity must be positive");
    if (!(options.refill_rate > 0))
        throw std::invalid_argument("RateLimiter: refill_rate must be positive");
}

static void validate_request(double tokens) {
    if (!(tokens >= 0))
        throw std::invalid_argument("RateLimiter: token count must not be negative");
}

// ── RateLimiter ──────────────────────────────────────────────────

RateLimiter::RateLimiter(const RateLimiterOptions& options, Clock& clock)
    : capacity_(options.capacity), refill_rate_(options.refill_rate), clock_(clock) {
    validate_options(options);
    tokens_ = std::clamp(options.initial_tokens.value_or(capacity_), 0.0, capacity_);
    last_refill_ms_ = clock_.now_ms();
}

void RateLimiter::refill_locked() {
    double now = clock_.now_ms();
    double elapsed_s = (now - last_refill_ms_) / 1000.0;
    if (elapsed_s > 0) {
        tokens_ = std::min(capacity_, tokens_ + elapsed_s * refill_rate_);
    }
    last_refill_ms_ = std::max(last_refill_ms_, now);
}

double RateLimiter::time_until_locked(double tokens) const {
    if (tokens_ >= tokens) return 0;
    return std::ceil((tokens - tokens_) / refill_rate_ * 1000.0);
}

bool RateLimiter::try_consume(double tokens) {
    validate_request(tokens);
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }
    return false;
}

bool RateLimiter::consume(double tokens, const std::atomic<bool>* abort_flag) {
    validate_request(tokens);
    if (tokens > capacity_) {
        throw std::invalid_argument("RateLimiter: requested " + std::to_string(tokens) +
                                    " tokens exceeds capacity " +
                                    std::to_string(capacity_));
    }
    for (;;) {
        if (abort_flag && abort_flag->load(std::memory_order_relaxed)) return false;

        double wait_ms;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill_locked();
            if (tokens_ >= tokens) {
                tokens_ -= tokens;
                return true;
            }
            wait_ms = time_until_locked(tokens);
        }
        if (abort_flag) wait_ms = std::min(wait_ms, ABORT_POLL_MS);
        // Sleep without holding the lock so other callers can still refill/consume
        clock_.sleep_for_ms(wait_ms);
    }
}

double RateLimiter::available_tokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    return tokens_;
}

double RateLimiter::time_until_tokens(double tokens) {
    validate_request(tokens);
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    return time_until_locked(tokens);
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = capacity_;
    last_refill_ms_ = clock_.now_ms();
}

// ── KeyedRateLimiter ─────────────────────────────────────────────

KeyedRateLimiter::KeyedRateLimiter(const RateLimiterOptions& options, Clock& clock)
    : options_(options), clock_(clock) {
    validate_options(options_);
}

std::shared_ptr<RateLimiter> KeyedRateLimiter::limiter_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(key);
    if (it != limiters_.end()) return it->second;
    auto limiter = std::make_shared<RateLimiter>(options_, clock_);
    limiters_.emplace(key, limiter);
    return limiter;
}

bool KeyedRateLimiter::consume(const std::string& key, double tokens,
                               const std::atomic<bool>* abort_flag) {
    // The shared_ptr keeps the bucket alive across a concurrent reset(key)
    return limiter_for(key)->consume(tokens, abort_flag);
}

bool KeyedRateLimiter::try_consume(const std::string& key, double tokens) {
    return limiter_for(key)->try_consume(tokens);
}

double KeyedRateLimiter::available_tokens(const std::string& key) {
    return limiter_for(key)->available_tokens();
}

double KeyedRateLimiter::time_until_tokens(const std::string& key, double tokens) {
    return limiter_for(key)->time_until_tokens(tokens);
}

void KeyedRateLimiter::reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    limiters_.erase(key);
}

void KeyedRateLimiter::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    limiters_.clear();
}

size_t KeyedRateLimiter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.size();
}

} // namespace aiu
