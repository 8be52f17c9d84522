#include "retry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace aiu {

bool is_retryable_status(long status_code) {
    return status_code == 429 || status_code == 408 || status_code == 409 ||
           (status_code >= 500 && status_code < 600);
}

bool is_retryable_default(const RetryContext& ctx) {
    if (!ctx.response) return true; // transport-level failure
    return is_retryable_status(ctx.response->status_code);
}

std::function<double(uint32_t)> exponential_backoff(double base_ms, double max_ms,
                                                    double jitter) {
    return [base_ms, max_ms, jitter](uint32_t attempt) {
        double exp = std::pow(2.0, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
        double delay = std::min(base_ms * exp, max_ms);
        if (jitter > 0) {
            thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_real_distribution<double> dist(0.0, jitter);
            delay += delay * dist(rng);
        }
        return std::floor(delay);
    };
}

RetryPolicy default_retry_policy() {
    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.is_retryable = is_retryable_default;
    policy.backoff_ms = exponential_backoff();
    return policy;
}

RetryPolicy RetryPolicy::none() {
    RetryPolicy policy;
    policy.max_attempts = 1;
    policy.is_retryable = [](const RetryContext&) { return false; };
    policy.backoff_ms = [](uint32_t) { return 0.0; };
    return policy;
}

std::optional<double> parse_retry_after_ms(const std::string& value, int64_t now_epoch_s) {
    if (value.empty()) return std::nullopt;

    // Delta seconds, e.g. "120"
    char* end = nullptr;
    long seconds = std::strtol(value.c_str(), &end, 10);
    if (end != value.c_str()) {
        if (seconds < 0) return std::nullopt;
        return static_cast<double>(seconds) * 1000.0;
    }

    // HTTP-date, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail()) return std::nullopt;
    int64_t when = static_cast<int64_t>(timegm(&tm));
    return static_cast<double>(std::max<int64_t>(0, when - now_epoch_s)) * 1000.0;
}

} // namespace aiu
