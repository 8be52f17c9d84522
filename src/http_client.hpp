#pragma once
#include "clock.hpp"
#include "http.hpp"
#include "rate_limiter.hpp"
#include "retry.hpp"
#include "sse.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aiu {

class EventBus;

struct RequestOptions {
    std::string method = "GET";
    std::string url;
    std::vector<Header> headers;     // fully formed; caller headers win over defaults
    std::string body;
    std::optional<std::string> rate_limit_key;
    std::optional<RetryPolicy> retry_policy; // overrides the client default
    bool stream = false;             // decode the body as an SSE JSON stream
    std::optional<long> timeout_seconds;
    std::string provider_id;         // used in error messages and events
};

struct HttpClientOptions {
    long timeout_seconds = 120;
    RetryPolicy retry_policy = default_retry_policy();
    std::string user_agent = "aiu/0.1.0";
};

struct HttpResult {
    HttpResponse response;               // body is empty for streams
    std::optional<SSEJsonStream> events; // set iff the request was streamed
    uint32_t attempts = 0;

    bool is_stream() const { return events.has_value(); }
};

// Request façade: rate-limit gate, bounded retries with backoff, and
// buffered or SSE-streamed responses. Retries happen only before a stream
// is handed to the caller; a stream that fails mid-flight throws from next().
class HttpClient {
public:
    explicit HttpClient(Transport& transport, HttpClientOptions options = {},
                        Clock& clock = default_clock());

    // Shared so several clients can throttle against the same keys.
    // Throws std::invalid_argument if the bucket capacity is below one token.
    void set_rate_limiter(std::shared_ptr<KeyedRateLimiter> limiter);
    KeyedRateLimiter* rate_limiter() const { return limiter_.get(); }

    // Observer for RequestStarted / RetryScheduled / RequestCompleted (may be null)
    void set_event_bus(EventBus* bus) { bus_ = bus; }

    // Checked while waiting for tokens and between attempts
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

    const HttpClientOptions& options() const { return options_; }

    // Throws TransportError or ResponseError once retries are exhausted.
    // A rate-limit wait has no timeout; use the abort flag to release it.
    HttpResult send(const RequestOptions& options);

    HttpResponse request(RequestOptions options);

    // Buffered request whose body is parsed as JSON
    nlohmann::json request_json(RequestOptions options);

    SSEJsonStream stream(RequestOptions options);

private:
    HttpRequest prepare(const RequestOptions& options) const;
    RetryPolicy effective_policy(const RequestOptions& options) const;
    double retry_delay_ms(const RetryPolicy& policy, const RetryContext& ctx) const;
    bool aborted() const;

    Transport& transport_;
    HttpClientOptions options_;
    Clock& clock_;
    std::shared_ptr<KeyedRateLimiter> limiter_;
    EventBus* bus_ = nullptr;
    const std::atomic<bool>* abort_flag_ = nullptr;
};

} // namespace aiu
