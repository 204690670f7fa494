#pragma once
#include <string>
#include <cstdint>

namespace largefile {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Lowercase ASCII letters
std::string to_lower(const std::string& s);

} // namespace largefile
