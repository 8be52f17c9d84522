#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace aiu {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Parse a whole string as a number; nullopt on any trailing garbage
std::optional<double> parse_number(const std::string& s);

} // namespace aiu
