#pragma once
#include "http.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace aiu {

// State of a request after a failed attempt
struct RetryContext {
    uint32_t attempt = 1;               // 1-based number of the attempt that failed
    uint32_t max_attempts = 1;
    std::string last_error;             // transport error message, empty for responses
    const HttpResponse* response = nullptr; // set when the server answered
    double elapsed_ms = 0;              // since the first attempt started
};

struct RetryPolicy {
    uint32_t max_attempts = 4;

    // Whether the failure described by the context may be retried
    std::function<bool(const RetryContext&)> is_retryable;

    // Delay before the attempt following `attempt` (1-based)
    std::function<double(uint32_t attempt)> backoff_ms;

    // Prefer a server-sent Retry-After over backoff_ms for 429/503
    bool respect_retry_after = true;

    // Never retries
    static RetryPolicy none();
};

// Defaults used when a policy leaves a hook unset
RetryPolicy default_retry_policy();

// Transport errors and 408 / 409 / 429 / 5xx responses
bool is_retryable_default(const RetryContext& ctx);

bool is_retryable_status(long status_code);

// min(base_ms * 2^(attempt-1), max_ms), plus up to `jitter` (fraction) on top
std::function<double(uint32_t)> exponential_backoff(double base_ms = 1000,
                                                    double max_ms = 30000,
                                                    double jitter = 0.2);

// Parse a Retry-After value (delta seconds or HTTP-date) into milliseconds.
// `now_epoch_s` is the current Unix time, used for HTTP-date values.
std::optional<double> parse_retry_after_ms(const std::string& value, int64_t now_epoch_s);

} // namespace aiu
