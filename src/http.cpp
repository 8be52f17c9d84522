#include "http.hpp"

#include <cctype>

namespace aiu {

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

const std::string* find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return &h.second;
    }
    return nullptr;
}

std::string StreamResponse::read_all() {
    std::string out;
    if (!body) return out;
    while (auto chunk = body->read()) {
        out += *chunk;
    }
    return out;
}

} // namespace aiu
