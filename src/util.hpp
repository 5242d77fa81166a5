#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolmux {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Number of lines in text (a trailing fragment counts as a line)
size_t count_lines(const std::string& text);

// First n bytes of s (whole string when shorter)
std::string prefix(const std::string& s, size_t n);

// Generate a simple unique ID (hex)
std::string generate_id();

// Estimate token count from text (~4 chars per token, rounded up)
uint32_t estimate_tokens(const std::string& text);

// "0.42s" below a minute, "1.50min" above
std::string format_duration(uint64_t elapsed_ms);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace toolmux
