#include "sse.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace aiu {

// ── SSEParser ───────────────────────────────────────────────────

static bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    for (;;) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (!process_line(line, callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }

    // Keep the incomplete tail for the next chunk
    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::process_line(const std::string& line, const SSECallback& callback) {
    if (is_blank(line)) {
        if (!has_data_) return true; // no spurious events between blank lines
        SSEEvent event = std::move(current_);
        current_ = SSEEvent{};
        has_data_ = false;
        return callback(event);
    }

    if (line[0] == ':') return true; // comment

    size_t colon = line.find(':');
    if (colon == std::string::npos) return true;

    std::string field = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    if (!value.empty() && value[0] == ' ') {
        value.erase(0, 1);
    }

    if (field == "event") {
        current_.event = std::move(value);
    } else if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
            current_.data += value;
        } else {
            current_.data = std::move(value);
            has_data_ = true;
        }
    } else if (field == "id") {
        current_.id = std::move(value);
    } else if (field == "retry") {
        // Leading integer: whitespace and a '+' sign are skipped, trailing text ignored
        const char* first = value.data();
        const char* last = value.data() + value.size();
        while (first != last && std::isspace(static_cast<unsigned char>(*first))) ++first;
        if (first != last && *first == '+') ++first;
        int64_t retry = 0;
        auto [ptr, ec] = std::from_chars(first, last, retry);
        if (ec == std::errc{}) current_.retry = retry;
    }
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    buffer_.clear();
    if (!has_data_) return true;
    SSEEvent event = std::move(current_);
    current_ = SSEEvent{};
    has_data_ = false;
    return callback(event);
}

void SSEParser::reset() {
    buffer_.clear();
    current_ = SSEEvent{};
    has_data_ = false;
}

bool SSEParser::has_pending() const {
    return !buffer_.empty() || has_data_;
}

std::string format_sse_event(const SSEEvent& event) {
    std::string out;
    if (event.event) out += "event: " + *event.event + "\n";
    if (event.id) out += "id: " + *event.id + "\n";
    if (event.retry) out += "retry: " + std::to_string(*event.retry) + "\n";

    size_t start = 0;
    for (;;) {
        size_t newline = event.data.find('\n', start);
        out += "data: " + event.data.substr(start, newline - start) + "\n";
        if (newline == std::string::npos) break;
        start = newline + 1;
    }
    out += "\n";
    return out;
}

// ── SSEEventStream ──────────────────────────────────────────────

SSEEventStream::SSEEventStream(std::unique_ptr<ByteSource> source)
    : source_(std::move(source)) {}

SSEEventStream::~SSEEventStream() {
    if (source_) source_->cancel();
}

SSEEventStream::SSEEventStream(SSEEventStream&& other) noexcept
    : source_(std::move(other.source_)),
      parser_(std::move(other.parser_)),
      ready_(std::move(other.ready_)),
      exhausted_(other.exhausted_),
      cancelled_(other.cancelled_.load()) {}

SSEEventStream& SSEEventStream::operator=(SSEEventStream&& other) noexcept {
    if (this != &other) {
        if (source_) source_->cancel();
        source_ = std::move(other.source_);
        parser_ = std::move(other.parser_);
        ready_ = std::move(other.ready_);
        exhausted_ = other.exhausted_;
        cancelled_ = other.cancelled_.load();
    }
    return *this;
}

std::optional<SSEEvent> SSEEventStream::next() {
    auto push = [this](const SSEEvent& event) {
        ready_.push_back(event);
        return true;
    };

    while (ready_.empty()) {
        if (cancelled_ || exhausted_ || !source_) return std::nullopt;

        std::optional<std::string> chunk;
        try {
            chunk = source_->read();
        } catch (const StreamInterrupted&) {
            // A partially received event must not be flushed later
            exhausted_ = true;
            parser_.reset();
            throw;
        }
        if (!chunk) {
            exhausted_ = true;
            parser_.finish(push);
            continue;
        }
        parser_.feed(*chunk, push);
    }

    if (cancelled_) {
        ready_.clear();
        return std::nullopt;
    }
    SSEEvent event = std::move(ready_.front());
    ready_.pop_front();
    return event;
}

void SSEEventStream::cancel() {
    cancelled_ = true;
    if (source_) source_->cancel();
}

bool SSEEventStream::done() const {
    return cancelled_ || ((exhausted_ || !source_) && ready_.empty());
}

// ── SSEJsonStream ───────────────────────────────────────────────

SSEJsonStream::SSEJsonStream(SSEEventStream events)
    : events_(std::move(events)) {}

SSEJsonStream::SSEJsonStream(std::unique_ptr<ByteSource> source)
    : events_(std::move(source)) {}

std::optional<nlohmann::json> SSEJsonStream::next() {
    while (!finished_) {
        auto event = events_.next();
        if (!event || event->data == SSE_DONE_SENTINEL) {
            finished_ = true;
            break;
        }

        auto value = nlohmann::json::parse(event->data, nullptr, false);
        if (value.is_discarded()) {
            ++skipped_; // heartbeat or non-JSON payload
            continue;
        }
        last_event_ = std::move(*event);
        return value;
    }
    return std::nullopt;
}

void SSEJsonStream::cancel() {
    events_.cancel();
}

bool SSEJsonStream::done() const {
    return finished_ || events_.done();
}

} // namespace aiu
