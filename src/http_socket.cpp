// HTTP/HTTPS transport using POSIX sockets + OpenSSL.
// Buffered responses honour the request timeout end to end; streamed
// responses honour it only until the response headers have arrived.
#include "http.hpp"
#include "errors.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace aiu {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool global_abort_requested() {
    return g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed);
}

static double steady_now_ms() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(now).count();
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw TransportError("invalid URL: " + url, ErrorCode::InvalidRequest);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw TransportError("unsupported URL scheme: " + scheme, ErrorCode::InvalidRequest);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw TransportError("invalid URL: " + url, ErrorCode::InvalidRequest);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

enum class ReadStatus { Ok, Eof, Error, Aborted, TimedOut };

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    std::atomic<bool> interrupted{false};
    double deadline_ms = 0; // 0 = no deadline
    ReadStatus last_status = ReadStatus::Ok;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Throws TransportError on DNS, connect or TLS failure.
    void connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            throw TransportError("cannot resolve " + url.host + ": " + gai_strerror(gai));

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected)
            throw TransportError("cannot connect to " + url.host + ":" + url.port);

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag and deadline checks work during body transfer.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) throw TransportError("TLS context creation failed");
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) throw TransportError("TLS session creation failed");
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                throw TransportError("TLS handshake with " + url.host + " failed: " + buf);
            }
        }

        set_socket_timeout(1);
    }

    // Unblock a pending read from another thread
    void interrupt() {
        interrupted = true;
        if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    }

    // Read some bytes; returns >0 on data, otherwise 0 and sets last_status.
    // EAGAIN (1-second slice expiry) loops back to check abort and deadline.
    size_t read_some(char* buf, size_t len) {
        while (true) {
            if (interrupted || global_abort_requested()) {
                last_status = ReadStatus::Aborted;
                return 0;
            }
            if (deadline_ms > 0 && steady_now_ms() > deadline_ms) {
                last_status = ReadStatus::TimedOut;
                return 0;
            }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return static_cast<size_t>(n);
                if (n == 0) { last_status = end_status(); return 0; }
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_ZERO_RETURN) { last_status = end_status(); return 0; }
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return static_cast<size_t>(n);
                if (n == 0) { last_status = end_status(); return 0; }
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            }
            last_status = interrupted ? ReadStatus::Aborted : ReadStatus::Error;
            return 0;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    // A shutdown() from interrupt() shows up as end-of-file
    ReadStatus end_status() const {
        return interrupted ? ReadStatus::Aborted : ReadStatus::Eof;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// Turn a failed read into the matching exception
[[noreturn]] static void throw_read_failure(const Connection& conn, const std::string& what) {
    switch (conn.last_status) {
        case ReadStatus::TimedOut:
            throw TransportError("timed out " + what, ErrorCode::Timeout);
        case ReadStatus::Aborted:
            throw TransportError("aborted " + what, ErrorCode::Aborted);
        case ReadStatus::Eof:
            throw TransportError("connection closed " + what);
        default:
            throw TransportError("read error " + what + ": " + std::strerror(errno));
    }
}

// ── Request building ───────────────────────────────────────────

static std::string build_request(const HttpRequest& request, const ParsedUrl& url) {
    std::string req;
    req.reserve(512 + request.body.size());
    req += request.method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    for (const auto& h : request.headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    if (!find_header(request.headers, "Content-Length") &&
        (!request.body.empty() || request.method == "POST" || request.method == "PUT" ||
         request.method == "PATCH"))
        req += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += request.body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false if the connection ended before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        size_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return false;
        leftover.append(buf, n);
    }
}

struct ResponseHead {
    long status = 0;
    std::vector<Header> headers;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers
static ResponseHead parse_response_head(Connection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line;
    if (!read_line(conn, leftover, status_line))
        throw_read_failure(conn, "before response status");

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (status_line.rfind("HTTP/", 0) != 0 || sp1 == std::string::npos)
        throw TransportError("malformed status line: " + status_line);
    head.status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (head.status < 100 || head.status > 999)
        throw TransportError("malformed status line: " + status_line);

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line))
            throw_read_failure(conn, "while reading response headers");
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);
        head.headers.emplace_back(name, value);

        std::string lname = name;
        for (auto& c : lname) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        std::string lvalue = value;
        for (auto& c : lvalue) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (lname == "transfer-encoding") {
            head.is_chunked = (lvalue.find("chunked") != std::string::npos);
        } else if (lname == "content-length") {
            char* end = nullptr;
            unsigned long long len = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                head.has_length = true;
                head.content_length = static_cast<size_t>(len);
            }
        }
    }
    return head;
}

// ── Incremental body reader ────────────────────────────────────

// Pull-based body decoder (chunked, content-length or read-to-close).
// Owns the connection; cancel() may be called from another thread.
class SocketBodySource : public ByteSource {
public:
    SocketBodySource(std::unique_ptr<Connection> conn, std::string leftover,
                     const ResponseHead& head)
        : conn_(std::move(conn)), leftover_(std::move(leftover)),
          is_chunked_(head.is_chunked), has_length_(head.has_length),
          remaining_(head.content_length) {
        if (!is_chunked_ && has_length_ && remaining_ == 0) done_ = true;
    }

    std::optional<std::string> read() override {
        if (done_ || conn_->interrupted) return std::nullopt;
        return is_chunked_ ? read_chunked() : read_plain();
    }

    void cancel() override {
        conn_->interrupt();
    }

    bool aborted() const { return conn_->last_status == ReadStatus::Aborted; }

private:
    // Take up to `max` bytes from leftover or the socket; 0 on end/failure
    size_t fill(char* buf, size_t max) {
        if (!leftover_.empty()) {
            size_t take = std::min(max, leftover_.size());
            std::memcpy(buf, leftover_.data(), take);
            leftover_.erase(0, take);
            return take;
        }
        return conn_->read_some(buf, max);
    }

    // End of input: clean close and abort end the sequence, errors throw
    std::optional<std::string> finish_on_failure(bool truncated) {
        done_ = true;
        ReadStatus st = conn_->last_status;
        if (st == ReadStatus::Aborted) return std::nullopt;
        if (st == ReadStatus::TimedOut)
            throw TransportError("timed out reading response body", ErrorCode::Timeout);
        if (st == ReadStatus::Eof && !truncated) return std::nullopt;
        if (st == ReadStatus::Eof)
            throw StreamInterrupted("connection closed before end of response body");
        throw StreamInterrupted(std::string("stream read failed: ") + std::strerror(errno));
    }

    std::optional<std::string> read_chunked() {
        if (chunk_remaining_ == 0) {
            std::string size_line;
            if (started_chunks_) {
                // trailing \r\n of the previous chunk
                if (!read_line(*conn_, leftover_, size_line)) return finish_on_failure(true);
            }
            // The body is only complete once the zero-size chunk arrives
            if (!read_line(*conn_, leftover_, size_line)) return finish_on_failure(true);
            started_chunks_ = true;
            // Chunk size is hex, may have extensions after ';'
            char* end = nullptr;
            chunk_remaining_ = std::strtoul(size_line.c_str(), &end, 16);
            if (end == size_line.c_str() ||
                (*end != '\0' && *end != ';' && *end != ' ' && *end != '\t')) {
                done_ = true;
                throw StreamInterrupted("malformed chunk size: " + size_line);
            }
            if (chunk_remaining_ == 0) {
                done_ = true;
                return std::nullopt;
            }
        }
        char buf[4096];
        size_t n = fill(buf, std::min(chunk_remaining_, sizeof(buf)));
        if (n == 0) return finish_on_failure(true); // server closed mid-chunk
        chunk_remaining_ -= n;
        return std::string(buf, n);
    }

    std::optional<std::string> read_plain() {
        size_t want = has_length_ ? std::min(remaining_, static_cast<size_t>(4096)) : 4096;
        char buf[4096];
        size_t n = fill(buf, want);
        if (n == 0) return finish_on_failure(has_length_);
        if (has_length_) {
            remaining_ -= n;
            if (remaining_ == 0) done_ = true;
        }
        return std::string(buf, n);
    }

    std::unique_ptr<Connection> conn_;
    std::string leftover_;
    bool is_chunked_;
    bool has_length_;
    size_t remaining_;
    size_t chunk_remaining_ = 0;
    bool started_chunks_ = false;
    bool done_ = false;
};

// ── Core request executor ──────────────────────────────────────

struct OpenedResponse {
    ResponseHead head;
    std::unique_ptr<Connection> conn;
    std::string leftover;
};

static OpenedResponse open_request(const HttpRequest& request) {
    ParsedUrl url = parse_url(request.url);

    OpenedResponse opened;
    opened.conn = std::make_unique<Connection>();
    opened.conn->connect(url, request.timeout_seconds);
    if (request.timeout_seconds > 0)
        opened.conn->deadline_ms = steady_now_ms() + request.timeout_seconds * 1000.0;

    std::string wire = build_request(request, url);
    if (!opened.conn->write_all(wire.c_str(), wire.size()))
        throw TransportError("failed to send request to " + url.host);

    opened.head = parse_response_head(*opened.conn, opened.leftover);
    return opened;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketTransport::send(const HttpRequest& request) {
    OpenedResponse opened = open_request(request);

    HttpResponse resp;
    resp.status_code = opened.head.status;
    resp.headers = opened.head.headers;

    SocketBodySource body(std::move(opened.conn), std::move(opened.leftover), opened.head);
    try {
        while (auto chunk = body.read()) {
            resp.body += *chunk;
        }
    } catch (const StreamInterrupted& e) {
        throw TransportError(e.what());
    }
    if (body.aborted())
        throw TransportError("aborted while reading response body", ErrorCode::Aborted);
    return resp;
}

StreamResponse SocketTransport::open_stream(const HttpRequest& request) {
    OpenedResponse opened = open_request(request);
    // Streams are long-lived: the deadline only covers connect + headers
    opened.conn->deadline_ms = 0;

    StreamResponse resp;
    resp.status_code = opened.head.status;
    resp.headers = opened.head.headers;
    resp.body = std::make_unique<SocketBodySource>(std::move(opened.conn),
                                                   std::move(opened.leftover),
                                                   opened.head);
    return resp;
}

} // namespace aiu
