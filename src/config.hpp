#pragma once
#include "http_client.hpp"
#include "rate_limiter.hpp"
#include "retry.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace aiu {

struct RateLimitConfig {
    bool enabled = false;
    double capacity = 60;      // burst size
    double refill_rate = 1;    // tokens per second
};

// Upper bound for max_retries; larger values are clamped
constexpr uint32_t MAX_RETRIES_LIMIT = 1000;

struct Config {
    long timeout_seconds = 120;
    uint32_t max_retries = 3;  // retries after the first attempt
    double retry_base_ms = 1000;
    double retry_max_ms = 30000;
    std::string user_agent = "aiu/0.1.0";
    RateLimitConfig rate_limit;

    // Load from a JSON file (default ~/.aiu/config.json) + env vars.
    // A missing or malformed file falls back to defaults.
    static Config load(const std::string& path = "~/.aiu/config.json");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse known keys; wrong types are ignored
    static Config from_json(const nlohmann::json& j);

    // AIU_* environment variables override file values
    void apply_env();

    RetryPolicy retry_policy() const;
    RateLimiterOptions rate_limiter_options() const;
    HttpClientOptions client_options() const;

    // Shared limiter built from rate_limit; nullptr when disabled
    std::shared_ptr<KeyedRateLimiter> make_rate_limiter(Clock& clock = default_clock()) const;
};

} // namespace aiu
