#pragma once
#include "byte_source.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace aiu {

// Payload that marks logical end of a JSON event stream
constexpr const char* SSE_DONE_SENTINEL = "[DONE]";

struct SSEEvent {
    std::optional<std::string> event; // event type (e.g. "message_start")
    std::string data;                 // data lines joined with '\n'
    std::optional<std::string> id;
    std::optional<int64_t> retry;     // reconnection time in ms

    bool operator==(const SSEEvent& other) const {
        return event == other.event && data == other.data &&
               id == other.id && retry == other.retry;
    }
    bool operator!=(const SSEEvent& other) const { return !(*this == other); }
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE frame decoder. Input may be split at any byte; an event
// is dispatched when its terminating blank line arrives.
class SSEParser {
public:
    // Feed a raw chunk; triggers callback for complete events.
    // Returns false if the callback stopped parsing; unprocessed lines
    // stay buffered for the next feed().
    bool feed(const std::string& chunk, const SSECallback& callback);

    // End of input: dispatch the pending event if it has data.
    // An unterminated trailing line is discarded.
    bool finish(const SSECallback& callback);

    // Reset parser state
    void reset();

    // True if a partial line or an undispatched event is held
    bool has_pending() const;

private:
    bool process_line(const std::string& line, const SSECallback& callback);

    std::string buffer_;
    SSEEvent current_;
    bool has_data_ = false;
};

// Encode one event as SSE text, terminated by a blank line
std::string format_sse_event(const SSEEvent& event);

// Lazy, single-pass sequence of SSE events pulled from a ByteSource.
// Not thread-safe except for cancel(), which may be called from any thread.
class SSEEventStream {
public:
    explicit SSEEventStream(std::unique_ptr<ByteSource> source);
    ~SSEEventStream();

    SSEEventStream(SSEEventStream&& other) noexcept;
    SSEEventStream& operator=(SSEEventStream&& other) noexcept;
    SSEEventStream(const SSEEventStream&) = delete;
    SSEEventStream& operator=(const SSEEventStream&) = delete;

    // Next event in wire order, or nullopt at end of stream / after cancel().
    // Throws StreamInterrupted if the source fails.
    std::optional<SSEEvent> next();

    // Terminate the sequence and cancel the source
    void cancel();

    bool done() const;

private:
    std::unique_ptr<ByteSource> source_;
    SSEParser parser_;
    std::deque<SSEEvent> ready_;
    bool exhausted_ = false;
    std::atomic<bool> cancelled_{false};
};

// Lazy sequence of JSON payloads decoded from SSE `data` fields.
// Stops at the [DONE] sentinel and skips payloads that are not valid JSON.
class SSEJsonStream {
public:
    explicit SSEJsonStream(SSEEventStream events);
    explicit SSEJsonStream(std::unique_ptr<ByteSource> source);

    std::optional<nlohmann::json> next();

    // next() converted with nlohmann::json::get<T>()
    template<typename T>
    std::optional<T> next_as() {
        auto value = next();
        if (!value) return std::nullopt;
        return value->get<T>();
    }

    void cancel();
    bool done() const;

    // SSE fields of the event that produced the last value
    const SSEEvent& last_event() const { return last_event_; }

    // Number of malformed payloads skipped so far
    size_t skipped() const { return skipped_; }

private:
    SSEEventStream events_;
    SSEEvent last_event_;
    bool finished_ = false;
    size_t skipped_ = 0;
};

} // namespace aiu
