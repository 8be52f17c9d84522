#include "http_client.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace aiu {

HttpClient::HttpClient(Transport& transport, HttpClientOptions options, Clock& clock)
    : transport_(transport), options_(std::move(options)), clock_(clock) {}

void HttpClient::set_rate_limiter(std::shared_ptr<KeyedRateLimiter> limiter) {
    // Each request takes one token, so a smaller bucket could never admit it
    if (limiter && limiter->options().capacity < 1)
        throw std::invalid_argument("HttpClient: rate limiter capacity must be at least 1");
    limiter_ = std::move(limiter);
}

bool HttpClient::aborted() const {
    return abort_flag_ && abort_flag_->load(std::memory_order_relaxed);
}

HttpRequest HttpClient::prepare(const RequestOptions& options) const {
    HttpRequest req;
    req.method = options.method;
    req.url = options.url;
    req.body = options.body;
    req.timeout_seconds = options.timeout_seconds.value_or(options_.timeout_seconds);

    if (!find_header(options.headers, "Content-Type"))
        req.headers.emplace_back("Content-Type", "application/json");
    if (!find_header(options.headers, "User-Agent"))
        req.headers.emplace_back("User-Agent", options_.user_agent);
    if (options.stream && !find_header(options.headers, "Accept"))
        req.headers.emplace_back("Accept", "text/event-stream");
    req.headers.insert(req.headers.end(), options.headers.begin(), options.headers.end());
    return req;
}

RetryPolicy HttpClient::effective_policy(const RequestOptions& options) const {
    RetryPolicy policy = options.retry_policy.value_or(options_.retry_policy);
    if (policy.max_attempts == 0) policy.max_attempts = 1;
    if (!policy.is_retryable) policy.is_retryable = is_retryable_default;
    if (!policy.backoff_ms) policy.backoff_ms = exponential_backoff();
    return policy;
}

double HttpClient::retry_delay_ms(const RetryPolicy& policy, const RetryContext& ctx) const {
    if (policy.respect_retry_after && ctx.response &&
        (ctx.response->status_code == 429 || ctx.response->status_code == 503)) {
        if (const std::string* value = ctx.response->header("Retry-After")) {
            auto delay = parse_retry_after_ms(*value, static_cast<int64_t>(epoch_seconds()));
            if (delay) return *delay;
        }
    }
    return std::max(0.0, policy.backoff_ms(ctx.attempt));
}

HttpResult HttpClient::send(const RequestOptions& options) {
    const RetryPolicy policy = effective_policy(options);
    const HttpRequest request = prepare(options);
    const std::string provider = options.provider_id.empty() ? "unknown" : options.provider_id;

    if (bus_) {
        RequestStartedEvent ev;
        ev.method = request.method;
        ev.url = request.url;
        ev.provider_id = options.provider_id;
        ev.rate_limit_key = options.rate_limit_key.value_or("");
        ev.stream = options.stream;
        bus_->publish(ev);
    }

    RequestCompletedEvent done;
    done.method = request.method;
    done.url = request.url;
    done.provider_id = options.provider_id;
    done.stream = options.stream;
    auto finish = [&](double start_ms) {
        done.latency_ms = clock_.now_ms() - start_ms;
        if (bus_) bus_->publish(done);
    };

    const double start = clock_.now_ms();

    if (options.rate_limit_key && limiter_) {
        if (!limiter_->consume(*options.rate_limit_key, 1, abort_flag_)) {
            done.error = "aborted while waiting for rate limit";
            finish(start);
            throw TransportError(done.error, ErrorCode::Aborted, options.provider_id);
        }
    }

    RetryContext ctx;
    ctx.max_attempts = policy.max_attempts;

    for (uint32_t attempt = 1;; ++attempt) {
        ctx.attempt = attempt;
        done.attempts = attempt;

        HttpResponse failed;
        std::optional<TransportError> transport_error;
        try {
            if (options.stream) {
                StreamResponse sr = transport_.open_stream(request);
                if (sr.ok()) {
                    HttpResult result;
                    result.response.status_code = sr.status_code;
                    result.response.headers = std::move(sr.headers);
                    result.events.emplace(std::move(sr.body));
                    result.attempts = attempt;
                    done.status_code = sr.status_code;
                    done.success = true;
                    finish(start);
                    return result;
                }
                failed.status_code = sr.status_code;
                failed.headers = std::move(sr.headers);
                try {
                    failed.body = sr.read_all();
                } catch (const TransportError& e) {
                    std::cerr << "[http] " << provider << ": error body truncated: "
                              << e.what() << '\n';
                }
            } else {
                HttpResponse resp = transport_.send(request);
                if (resp.ok()) {
                    HttpResult result;
                    result.attempts = attempt;
                    done.status_code = resp.status_code;
                    done.success = true;
                    result.response = std::move(resp);
                    finish(start);
                    return result;
                }
                failed = std::move(resp);
            }
        } catch (const TransportError& e) {
            transport_error = e;
        }

        if (transport_error) {
            ctx.response = nullptr;
            ctx.last_error = transport_error->what();
        } else {
            ctx.response = &failed;
            ctx.last_error.clear();
        }
        ctx.elapsed_ms = clock_.now_ms() - start;

        // Malformed URLs and explicit aborts will not improve on retry
        bool fatal = transport_error && (transport_error->code() == ErrorCode::Aborted ||
                                         transport_error->code() == ErrorCode::InvalidRequest);
        bool retry = !fatal && attempt < policy.max_attempts && !aborted() &&
                     policy.is_retryable(ctx);

        std::string reason = transport_error
            ? ctx.last_error
            : "HTTP " + std::to_string(failed.status_code);

        if (!retry) {
            if (policy.max_attempts > 1) {
                std::cerr << "[http] " << provider << " " << request.method << " " << request.url
                          << " failed after " << attempt << " attempt(s): " << reason << '\n';
            }
            done.status_code = failed.status_code;
            if (transport_error) {
                done.error = ctx.last_error;
                finish(start);
                throw TransportError(ctx.last_error, transport_error->code(), options.provider_id);
            }
            ResponseError err = make_response_error(failed.status_code, failed.body,
                                                    options.provider_id);
            done.error = err.what();
            finish(start);
            throw err;
        }

        double delay = retry_delay_ms(policy, ctx);
        std::cerr << "[http] " << provider << " attempt " << attempt << "/"
                  << policy.max_attempts << " failed (" << reason << "), retrying in "
                  << static_cast<long>(delay) << "ms\n";

        if (bus_) {
            RetryScheduledEvent ev;
            ev.url = request.url;
            ev.provider_id = options.provider_id;
            ev.attempt = attempt;
            ev.max_attempts = policy.max_attempts;
            ev.status_code = failed.status_code;
            ev.error = ctx.last_error;
            ev.delay_ms = delay;
            ev.elapsed_ms = ctx.elapsed_ms;
            bus_->publish(ev);
        }
        clock_.sleep_for_ms(delay);
    }
}

HttpResponse HttpClient::request(RequestOptions options) {
    options.stream = false;
    return send(options).response;
}

nlohmann::json HttpClient::request_json(RequestOptions options) {
    std::string provider_id = options.provider_id;
    HttpResponse resp = request(std::move(options));
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw AiuError(ErrorCode::Parsing,
                       "Failed to parse response from provider \"" +
                       (provider_id.empty() ? std::string("unknown") : provider_id) +
                       "\": body is not valid JSON",
                       provider_id);
    }
    return j;
}

SSEJsonStream HttpClient::stream(RequestOptions options) {
    options.stream = true;
    HttpResult result = send(options);
    return std::move(*result.events);
}

} // namespace aiu
