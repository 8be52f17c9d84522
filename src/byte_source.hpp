#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace aiu {

// Pull-based source of raw byte chunks (e.g. an HTTP response body).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Next chunk, or nullopt once the source is exhausted or cancelled.
    // May block. Throws StreamInterrupted if the underlying connection fails.
    virtual std::optional<std::string> read() = 0;

    // Stop producing chunks and release the underlying resource.
    // Safe to call more than once.
    virtual void cancel() = 0;
};

// In-memory source yielding a fixed list of chunks in order
class ChunkListSource : public ByteSource {
public:
    ChunkListSource() = default;
    explicit ChunkListSource(std::vector<std::string> chunks);

    std::optional<std::string> read() override;
    void cancel() override;

    bool cancelled() const { return cancelled_; }
    size_t reads() const { return reads_; }

private:
    std::deque<std::string> chunks_;
    bool cancelled_ = false;
    size_t reads_ = 0;
};

} // namespace aiu
