#pragma once
#include "http.hpp"
#include "errors.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace aiu {

// Yields its chunks, then fails once as a dropped connection would;
// later reads report end of input, as SocketTransport bodies do
class InterruptedSource : public ByteSource {
public:
    explicit InterruptedSource(std::vector<std::string> chunks)
        : chunks_(chunks.begin(), chunks.end()) {}

    std::optional<std::string> read() override {
        if (cancelled_ || failed_) return std::nullopt;
        if (chunks_.empty()) {
            failed_ = true;
            throw StreamInterrupted("connection reset by peer");
        }
        std::string chunk = chunks_.front();
        chunks_.pop_front();
        return chunk;
    }

    void cancel() override { cancelled_ = true; }

private:
    std::deque<std::string> chunks_;
    bool cancelled_ = false;
    bool failed_ = false;
};

class MockTransport : public Transport {
public:
    struct Step {
        long status = 200;
        std::vector<Header> headers;
        std::string body;
        std::vector<std::string> chunks; // stream body; defaults to {body}
        std::string error;               // non-empty: throw TransportError
        bool interrupt = false;          // stream fails after its chunks
    };

    std::deque<Step> steps;
    Step fallback;                       // used once steps run out
    std::vector<HttpRequest> requests;
    int call_count = 0;
    int stream_call_count = 0;

    MockTransport& respond(long status, std::string body = {}) {
        Step s;
        s.status = status;
        s.body = std::move(body);
        steps.push_back(std::move(s));
        return *this;
    }

    MockTransport& fail(std::string error) {
        Step s;
        s.error = std::move(error);
        steps.push_back(std::move(s));
        return *this;
    }

    MockTransport& stream(std::vector<std::string> chunks, bool interrupt = false) {
        Step s;
        s.chunks = std::move(chunks);
        s.interrupt = interrupt;
        steps.push_back(std::move(s));
        return *this;
    }

    HttpResponse send(const HttpRequest& request) override {
        call_count++;
        Step s = next_step(request);
        HttpResponse resp;
        resp.status_code = s.status;
        resp.headers = s.headers;
        resp.body = s.body;
        return resp;
    }

    StreamResponse open_stream(const HttpRequest& request) override {
        call_count++;
        stream_call_count++;
        Step s = next_step(request);
        std::vector<std::string> chunks = s.chunks;
        if (chunks.empty() && !s.body.empty()) chunks.push_back(s.body);

        StreamResponse resp;
        resp.status_code = s.status;
        resp.headers = s.headers;
        if (s.interrupt)
            resp.body = std::make_unique<InterruptedSource>(std::move(chunks));
        else
            resp.body = std::make_unique<ChunkListSource>(std::move(chunks));
        return resp;
    }

private:
    Step next_step(const HttpRequest& request) {
        requests.push_back(request);
        Step s = fallback;
        if (!steps.empty()) {
            s = steps.front();
            steps.pop_front();
        }
        if (!s.error.empty()) throw TransportError(s.error);
        return s;
    }
};

} // namespace aiu
