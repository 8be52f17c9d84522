#include "byte_source.hpp"

namespace aiu {

ChunkListSource::ChunkListSource(std::vector<std::string> chunks)
    : chunks_(chunks.begin(), chunks.end()) {}

std::optional<std::string> ChunkListSource::read() {
    if (cancelled_ || chunks_.empty()) return std::nullopt;
    ++reads_;
    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

void ChunkListSource::cancel() {
    cancelled_ = true;
    chunks_.clear();
}

} // namespace aiu
