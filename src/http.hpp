#pragma once
#include "byte_source.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace aiu {

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// Case-insensitive header lookup; returns nullptr if absent
const std::string* find_header(const std::vector<Header>& headers, const std::string& name);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<Header> headers;
    std::string body;
    long timeout_seconds = 120;
};

struct HttpResponse {
    long status_code = 0;
    std::vector<Header> headers;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
    const std::string* header(const std::string& name) const {
        return find_header(headers, name);
    }
};

// Response whose body is consumed incrementally
struct StreamResponse {
    long status_code = 0;
    std::vector<Header> headers;
    std::unique_ptr<ByteSource> body;

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Drain the remaining body into a string (used for error responses)
    std::string read_all();
};

// Abstract wire layer (injectable for testing).
// Both calls throw TransportError when no HTTP response could be obtained.
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;

    // Send the request and return once the response headers are read
    virtual StreamResponse open_stream(const HttpRequest& request) = 0;
};

// HTTP/1.1 over POSIX sockets, with OpenSSL for https URLs
class SocketTransport : public Transport {
public:
    HttpResponse send(const HttpRequest& request) override;
    StreamResponse open_stream(const HttpRequest& request) override;
};

} // namespace aiu
