#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace aiu {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::BadApiKey:         return "BAD_API_KEY";
        case ErrorCode::RateLimit:         return "RATE_LIMIT";
        case ErrorCode::Timeout:           return "TIMEOUT";
        case ErrorCode::ProviderDown:      return "PROVIDER_DOWN";
        case ErrorCode::NotFound:          return "NOT_FOUND";
        case ErrorCode::InvalidRequest:    return "INVALID_REQUEST";
        case ErrorCode::Network:           return "NETWORK_ERROR";
        case ErrorCode::Parsing:           return "PARSING_ERROR";
        case ErrorCode::StreamInterrupted: return "STREAM_INTERRUPTED";
        case ErrorCode::Aborted:           return "ABORTED";
    }
    return "UNKNOWN";
}

AiuError::AiuError(ErrorCode code, const std::string& message, std::string provider_id)
    : std::runtime_error(message), code_(code), provider_id_(std::move(provider_id)) {}

TransportError::TransportError(const std::string& message, ErrorCode code,
                               std::string provider_id)
    : AiuError(code, message, std::move(provider_id)) {}

StreamInterrupted::StreamInterrupted(const std::string& message, std::string provider_id)
    : TransportError(message, ErrorCode::StreamInterrupted, std::move(provider_id)) {}

ResponseError::ResponseError(long status_code, std::string body, const std::string& message,
                             std::string provider_id)
    : AiuError(error_code_for_status(status_code), message, std::move(provider_id)),
      status_code_(status_code), body_(std::move(body)) {}

ErrorCode error_code_for_status(long status_code) {
    if (status_code == 401 || status_code == 403) return ErrorCode::BadApiKey;
    if (status_code == 404) return ErrorCode::NotFound;
    if (status_code == 408) return ErrorCode::Timeout;
    if (status_code == 429) return ErrorCode::RateLimit;
    if (status_code >= 500 && status_code < 600) return ErrorCode::ProviderDown;
    return ErrorCode::InvalidRequest;
}

// Providers report errors as {"error": {"message": ...}} or {"message": ...}
static std::string extract_error_message(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};
    if (j.contains("error")) {
        const auto& err = j["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
        if (err.is_string()) return err.get<std::string>();
    }
    if (j.contains("message") && j["message"].is_string())
        return j["message"].get<std::string>();
    return {};
}

ResponseError make_response_error(long status_code, const std::string& body,
                                  const std::string& provider_id) {
    std::string provider = provider_id.empty() ? "unknown" : provider_id;
    std::string message = "Provider \"" + provider + "\" returned HTTP " +
                          std::to_string(status_code);
    std::string detail = extract_error_message(body);
    if (!detail.empty()) message += ": " + detail;
    return ResponseError(status_code, body, message, provider_id);
}

} // namespace aiu
