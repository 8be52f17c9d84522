#include <catch2/catch_test_macros.hpp>
#include "retry.hpp"

using namespace aiu;

static RetryContext response_context(long status, HttpResponse& resp) {
    resp.status_code = status;
    RetryContext ctx;
    ctx.response = &resp;
    return ctx;
}

// ── Retryable classification ─────────────────────────────────────

TEST_CASE("is_retryable_status: transient statuses", "[retry]") {
    REQUIRE(is_retryable_status(408));
    REQUIRE(is_retryable_status(409));
    REQUIRE(is_retryable_status(429));
    REQUIRE(is_retryable_status(500));
    REQUIRE(is_retryable_status(502));
    REQUIRE(is_retryable_status(503));
    REQUIRE(is_retryable_status(599));
}

TEST_CASE("is_retryable_status: client errors are final", "[retry]") {
    REQUIRE_FALSE(is_retryable_status(400));
    REQUIRE_FALSE(is_retryable_status(401));
    REQUIRE_FALSE(is_retryable_status(403));
    REQUIRE_FALSE(is_retryable_status(404));
    REQUIRE_FALSE(is_retryable_status(422));
    REQUIRE_FALSE(is_retryable_status(600));
}

TEST_CASE("is_retryable_default: transport failures retry", "[retry]") {
    RetryContext ctx;
    ctx.last_error = "connection refused";
    REQUIRE(is_retryable_default(ctx));
}

TEST_CASE("is_retryable_default: follows response status", "[retry]") {
    HttpResponse resp;
    REQUIRE(is_retryable_default(response_context(503, resp)));
    REQUIRE_FALSE(is_retryable_default(response_context(400, resp)));
}

// ── Backoff ──────────────────────────────────────────────────────

TEST_CASE("exponential_backoff: doubles per attempt without jitter", "[retry]") {
    auto backoff = exponential_backoff(100, 10000, 0);
    REQUIRE(backoff(1) == 100);
    REQUIRE(backoff(2) == 200);
    REQUIRE(backoff(3) == 400);
    REQUIRE(backoff(4) == 800);
}

TEST_CASE("exponential_backoff: capped at max", "[retry]") {
    auto backoff = exponential_backoff(1000, 5000, 0);
    REQUIRE(backoff(3) == 4000);
    REQUIRE(backoff(4) == 5000);
    REQUIRE(backoff(20) == 5000);
}

TEST_CASE("exponential_backoff: jitter only adds", "[retry]") {
    auto backoff = exponential_backoff(1000, 30000, 0.2);
    for (int i = 0; i < 50; ++i) {
        double d = backoff(2);
        REQUIRE(d >= 2000);
        REQUIRE(d <= 2400);
    }
}

TEST_CASE("exponential_backoff: result is whole milliseconds", "[retry]") {
    auto backoff = exponential_backoff(333, 30000, 0.2);
    for (int i = 0; i < 20; ++i) {
        double d = backoff(1);
        REQUIRE(d == static_cast<double>(static_cast<long>(d)));
    }
}

// ── Policies ─────────────────────────────────────────────────────

TEST_CASE("default_retry_policy: four attempts with hooks set", "[retry]") {
    RetryPolicy policy = default_retry_policy();
    REQUIRE(policy.max_attempts == 4);
    REQUIRE(policy.is_retryable);
    REQUIRE(policy.backoff_ms);
    REQUIRE(policy.respect_retry_after);
}

TEST_CASE("RetryPolicy::none: single attempt, nothing retryable", "[retry]") {
    RetryPolicy policy = RetryPolicy::none();
    REQUIRE(policy.max_attempts == 1);
    RetryContext ctx;
    REQUIRE_FALSE(policy.is_retryable(ctx));
    REQUIRE(policy.backoff_ms(1) == 0);
}

// ── Retry-After ──────────────────────────────────────────────────

TEST_CASE("parse_retry_after_ms: delta seconds", "[retry]") {
    REQUIRE(parse_retry_after_ms("3", 0) == 3000.0);
    REQUIRE(parse_retry_after_ms("0", 0) == 0.0);
    REQUIRE(parse_retry_after_ms("120", 0) == 120000.0);
}

TEST_CASE("parse_retry_after_ms: HTTP-date relative to now", "[retry]") {
    // Wed, 21 Oct 2015 07:28:00 GMT == 1445412480
    const int64_t date = 1445412480;
    auto ms = parse_retry_after_ms("Wed, 21 Oct 2015 07:28:00 GMT", date - 5);
    REQUIRE(ms == 5000.0);
}

TEST_CASE("parse_retry_after_ms: HTTP-date in the past is zero", "[retry]") {
    auto ms = parse_retry_after_ms("Wed, 21 Oct 2015 07:28:00 GMT", 1445412480 + 60);
    REQUIRE(ms == 0.0);
}

TEST_CASE("parse_retry_after_ms: rejects garbage", "[retry]") {
    REQUIRE_FALSE(parse_retry_after_ms("", 0).has_value());
    REQUIRE_FALSE(parse_retry_after_ms("soon", 0).has_value());
    REQUIRE_FALSE(parse_retry_after_ms("-5", 0).has_value());
}
