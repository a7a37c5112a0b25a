#pragma once
#include <string>
#include <cstdint>

namespace guidctl {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// True if s is non-empty and every character is 0-9 or A-F
bool is_upper_hex(const std::string& s);

// True if s is an optionally signed run of decimal digits
bool is_integer(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace guidctl
