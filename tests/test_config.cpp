#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "mock_clock.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace aiu;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE(cfg.max_retries == 3);
    REQUIRE(cfg.retry_base_ms == 1000);
    REQUIRE(cfg.retry_max_ms == 30000);
    REQUIRE_FALSE(cfg.rate_limit.enabled);
}

TEST_CASE("Config::defaults_json: mirrors struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.timeout_seconds == plain.timeout_seconds);
    REQUIRE(cfg.max_retries == plain.max_retries);
    REQUIRE(cfg.user_agent == plain.user_agent);
    REQUIRE(cfg.rate_limit.capacity == plain.rate_limit.capacity);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads known keys", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "timeout_seconds": 30,
        "max_retries": 5,
        "retry_base_ms": 250,
        "retry_max_ms": 4000,
        "user_agent": "custom/1.0",
        "rate_limit": { "enabled": true, "capacity": 10, "refill_rate": 0.5 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.timeout_seconds == 30);
    REQUIRE(cfg.max_retries == 5);
    REQUIRE(cfg.retry_base_ms == 250);
    REQUIRE(cfg.retry_max_ms == 4000);
    REQUIRE(cfg.user_agent == "custom/1.0");
    REQUIRE(cfg.rate_limit.enabled);
    REQUIRE(cfg.rate_limit.capacity == 10);
    REQUIRE(cfg.rate_limit.refill_rate == 0.5);
}

TEST_CASE("Config::from_json: partial object keeps defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json{{"max_retries", 0}});
    REQUIRE(cfg.max_retries == 0);
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE(cfg.rate_limit.capacity == 60);
}

TEST_CASE("Config::from_json: wrong types ignored", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "timeout_seconds": "fast",
        "max_retries": -2,
        "user_agent": 7,
        "rate_limit": { "enabled": "yes", "capacity": 0 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE(cfg.max_retries == 3);
    REQUIRE(cfg.user_agent == "aiu/0.1.0");
    REQUIRE_FALSE(cfg.rate_limit.enabled);
    REQUIRE(cfg.rate_limit.capacity == 60);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.timeout_seconds == 120);
}

// ── Derived options ──────────────────────────────────────────────

TEST_CASE("Config::retry_policy: attempts are retries plus one", "[config]") {
    Config cfg;
    cfg.max_retries = 2;
    REQUIRE(cfg.retry_policy().max_attempts == 3);
    cfg.max_retries = 0;
    REQUIRE(cfg.retry_policy().max_attempts == 1);
}

TEST_CASE("Config::retry_policy: backoff uses configured bounds", "[config]") {
    Config cfg;
    cfg.retry_base_ms = 100;
    cfg.retry_max_ms = 150;
    auto policy = cfg.retry_policy();
    double first = policy.backoff_ms(1);
    REQUIRE(first >= 100);
    REQUIRE(first <= 120);
    double capped = policy.backoff_ms(6);
    REQUIRE(capped >= 150);
    REQUIRE(capped <= 180);
}

TEST_CASE("Config::client_options: carries timeout and user agent", "[config]") {
    Config cfg;
    cfg.timeout_seconds = 9;
    cfg.user_agent = "x/2";
    auto opts = cfg.client_options();
    REQUIRE(opts.timeout_seconds == 9);
    REQUIRE(opts.user_agent == "x/2");
    REQUIRE(opts.retry_policy.max_attempts == 4);
}

TEST_CASE("Config::make_rate_limiter: null when disabled", "[config]") {
    Config cfg;
    ManualClock clock;
    REQUIRE(cfg.make_rate_limiter(clock) == nullptr);
}

TEST_CASE("Config::make_rate_limiter: uses configured bucket", "[config]") {
    Config cfg;
    cfg.rate_limit.enabled = true;
    cfg.rate_limit.capacity = 7;
    cfg.rate_limit.refill_rate = 2;
    ManualClock clock;
    auto limiter = cfg.make_rate_limiter(clock);
    REQUIRE(limiter != nullptr);
    REQUIRE(limiter->available_tokens("k") == 7);
    REQUIRE(limiter->options().refill_rate == 2);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "aiu_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : {"AIU_TIMEOUT_SECONDS", "AIU_MAX_RETRIES", "AIU_RETRY_BASE_MS",
                                 "AIU_RETRY_MAX_MS", "AIU_RATE_LIMIT_CAPACITY",
                                 "AIU_RATE_LIMIT_REFILL", "AIU_USER_AGENT"}) {
            unsetenv(name);
        }
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.aiu/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.aiu");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "timeout_seconds": 45,
        "rate_limit": { "enabled": true, "capacity": 3 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.timeout_seconds == 45);
    REQUIRE(cfg.rate_limit.enabled);
    REQUIRE(cfg.rate_limit.capacity == 3);
    REQUIRE(cfg.rate_limit.refill_rate == 1);
}

TEST_CASE("Config::load: missing file gives defaults without creating one", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load();
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.max_retries == 3);
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"max_retries": 1})";
    }
    Config cfg = Config::load(path);
    REQUIRE(cfg.max_retries == 1);
}

// ── Environment overrides ───────────────────────────────────────

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"timeout_seconds": 45, "max_retries": 5})");
    setenv("AIU_TIMEOUT_SECONDS", "10", 1);
    setenv("AIU_USER_AGENT", "env-agent", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.timeout_seconds == 10);
    REQUIRE(cfg.max_retries == 5);
    REQUIRE(cfg.user_agent == "env-agent");

    unsetenv("AIU_TIMEOUT_SECONDS");
    unsetenv("AIU_USER_AGENT");
}

TEST_CASE("Config::apply_env: rate limit vars enable the limiter", "[config]") {
    ConfigTestGuard g;
    setenv("AIU_RATE_LIMIT_CAPACITY", "5", 1);

    Config cfg;
    cfg.apply_env();
    REQUIRE(cfg.rate_limit.enabled);
    REQUIRE(cfg.rate_limit.capacity == 5);

    unsetenv("AIU_RATE_LIMIT_CAPACITY");
}

TEST_CASE("Config::apply_env: huge retry counts are clamped", "[config]") {
    ConfigTestGuard g;
    setenv("AIU_MAX_RETRIES", "1e20", 1);

    Config cfg;
    cfg.apply_env();
    REQUIRE(cfg.max_retries == MAX_RETRIES_LIMIT);
    REQUIRE(cfg.retry_policy().max_attempts == MAX_RETRIES_LIMIT + 1);

    unsetenv("AIU_MAX_RETRIES");
}

TEST_CASE("Config::from_json: huge retry counts are clamped", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::parse(R"({"max_retries": 4294967295})"));
    REQUIRE(cfg.max_retries == MAX_RETRIES_LIMIT);
}

TEST_CASE("Config::apply_env: non-numeric values ignored", "[config]") {
    ConfigTestGuard g;
    setenv("AIU_MAX_RETRIES", "many", 1);

    Config cfg;
    cfg.apply_env();
    REQUIRE(cfg.max_retries == 3);

    unsetenv("AIU_MAX_RETRIES");
}
