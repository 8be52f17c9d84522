#pragma once
#include <cstdint>
#include <string>

namespace aiu {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* RequestStarted   = "RequestStarted";
    constexpr const char* RetryScheduled   = "RetryScheduled";
    constexpr const char* RequestCompleted = "RequestCompleted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct RequestStartedEvent : Event {
    static constexpr const char* TAG = event_tags::RequestStarted;
    std::string method;
    std::string url;
    std::string provider_id;
    std::string rate_limit_key;
    bool stream = false;

    RequestStartedEvent() { type_tag = TAG; }
};

// Published before sleeping ahead of a retry
struct RetryScheduledEvent : Event {
    static constexpr const char* TAG = event_tags::RetryScheduled;
    std::string url;
    std::string provider_id;
    uint32_t attempt = 0;      // attempt that just failed (1-based)
    uint32_t max_attempts = 0;
    long status_code = 0;      // 0 for transport errors
    std::string error;
    double delay_ms = 0;
    double elapsed_ms = 0;

    RetryScheduledEvent() { type_tag = TAG; }
};

// Published once per send(), on success or failure.
// For streams, "completed" means the response headers were accepted.
struct RequestCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::RequestCompleted;
    std::string method;
    std::string url;
    std::string provider_id;
    long status_code = 0;
    uint32_t attempts = 0;
    double latency_ms = 0;
    bool stream = false;
    bool success = false;
    std::string error;

    RequestCompletedEvent() { type_tag = TAG; }
};

} // namespace aiu
