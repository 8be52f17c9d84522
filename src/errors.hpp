#pragma once
#include <stdexcept>
#include <string>

namespace aiu {

enum class ErrorCode {
    BadApiKey,
    RateLimit,
    Timeout,
    ProviderDown,
    NotFound,
    InvalidRequest,
    Network,
    Parsing,
    StreamInterrupted,
    Aborted,
};

// Stable upper-case name, e.g. "RATE_LIMIT"
const char* error_code_name(ErrorCode code);

// Base of every error raised by the transport layer
class AiuError : public std::runtime_error {
public:
    AiuError(ErrorCode code, const std::string& message, std::string provider_id = {});

    ErrorCode code() const { return code_; }
    const std::string& provider_id() const { return provider_id_; }

private:
    ErrorCode code_;
    std::string provider_id_;
};

// Network-level failure: DNS, connect, TLS, timeout, malformed HTTP
class TransportError : public AiuError {
public:
    explicit TransportError(const std::string& message,
                            ErrorCode code = ErrorCode::Network,
                            std::string provider_id = {});
};

// The connection failed after a stream had started delivering data
class StreamInterrupted : public TransportError {
public:
    explicit StreamInterrupted(const std::string& message, std::string provider_id = {});
};

// Non-success HTTP response that was not (or no longer) retried
class ResponseError : public AiuError {
public:
    ResponseError(long status_code, std::string body, const std::string& message,
                  std::string provider_id = {});

    long status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    long status_code_;
    std::string body_;
};

// Map an HTTP status to an error code
ErrorCode error_code_for_status(long status_code);

// Build a ResponseError, extracting error.message / message from a JSON body
ResponseError make_response_error(long status_code, const std::string& body,
                                  const std::string& provider_id);

} // namespace aiu
