#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace aiu {

nlohmann::json Config::defaults_json() {
    return {
        {"timeout_seconds", 120},
        {"max_retries", 3},
        {"retry_base_ms", 1000},
        {"retry_max_ms", 30000},
        {"user_agent", "aiu/0.1.0"},
        {"rate_limit", {
            {"enabled", false},
            {"capacity", 60},
            {"refill_rate", 1}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& input) {
    Config cfg;
    if (!input.is_object()) return cfg;
    nlohmann::json j = merge_defaults(input, defaults_json());

    if (j["timeout_seconds"].is_number_integer() && j["timeout_seconds"].get<long>() > 0)
        cfg.timeout_seconds = j["timeout_seconds"].get<long>();
    if (j["max_retries"].is_number_integer() && j["max_retries"].get<long long>() >= 0)
        cfg.max_retries = static_cast<uint32_t>(
            std::min<long long>(j["max_retries"].get<long long>(), MAX_RETRIES_LIMIT));
    if (j["retry_base_ms"].is_number())
        cfg.retry_base_ms = j["retry_base_ms"].get<double>();
    if (j["retry_max_ms"].is_number())
        cfg.retry_max_ms = j["retry_max_ms"].get<double>();
    if (j["user_agent"].is_string())
        cfg.user_agent = j["user_agent"].get<std::string>();

    if (j["rate_limit"].is_object()) {
        auto& r = j["rate_limit"];
        if (r.contains("enabled") && r["enabled"].is_boolean())
            cfg.rate_limit.enabled = r["enabled"].get<bool>();
        if (r.contains("capacity") && r["capacity"].is_number() && r["capacity"].get<double>() > 0)
            cfg.rate_limit.capacity = r["capacity"].get<double>();
        if (r.contains("refill_rate") && r["refill_rate"].is_number() &&
            r["refill_rate"].get<double>() > 0)
            cfg.rate_limit.refill_rate = r["refill_rate"].get<double>();
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[config] Ignoring malformed config: " << config_path << "\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

static std::optional<double> env_number(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    auto n = parse_number(v);
    if (!n) std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
    return n;
}

void Config::apply_env() {
    if (auto v = env_number("AIU_TIMEOUT_SECONDS"); v && *v > 0)
        timeout_seconds = static_cast<long>(std::min(*v, 86400.0 * 365));
    if (auto v = env_number("AIU_MAX_RETRIES"); v && *v >= 0)
        max_retries = static_cast<uint32_t>(std::min(*v, static_cast<double>(MAX_RETRIES_LIMIT)));
    if (auto v = env_number("AIU_RETRY_BASE_MS"); v && *v >= 0)
        retry_base_ms = *v;
    if (auto v = env_number("AIU_RETRY_MAX_MS"); v && *v >= 0)
        retry_max_ms = *v;
    if (auto v = env_number("AIU_RATE_LIMIT_CAPACITY"); v && *v > 0) {
        rate_limit.capacity = *v;
        rate_limit.enabled = true;
    }
    if (auto v = env_number("AIU_RATE_LIMIT_REFILL"); v && *v > 0) {
        rate_limit.refill_rate = *v;
        rate_limit.enabled = true;
    }
    if (const char* v = std::getenv("AIU_USER_AGENT"))
        user_agent = v;
}

RetryPolicy Config::retry_policy() const {
    RetryPolicy policy = default_retry_policy();
    policy.max_attempts = max_retries + 1;
    policy.backoff_ms = exponential_backoff(retry_base_ms, retry_max_ms);
    return policy;
}

RateLimiterOptions Config::rate_limiter_options() const {
    RateLimiterOptions options;
    options.capacity = rate_limit.capacity;
    options.refill_rate = rate_limit.refill_rate;
    return options;
}

HttpClientOptions Config::client_options() const {
    HttpClientOptions options;
    options.timeout_seconds = timeout_seconds;
    options.retry_policy = retry_policy();
    options.user_agent = user_agent;
    return options;
}

std::shared_ptr<KeyedRateLimiter> Config::make_rate_limiter(Clock& clock) const {
    if (!rate_limit.enabled) return nullptr;
    return std::make_shared<KeyedRateLimiter>(rate_limiter_options(), clock);
}

} // namespace aiu
