#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sh1ft::utils {

// hex digit utilities
bool is_hex_digit(char c);
uint8_t parse_hex_digit(char c);

// hex text validation; whitespace and comments are ignored
bool is_valid_hex_pattern(const std::string& pattern);
std::string normalize_hex_pattern(const std::string& pattern);

// "48 89 e5" style rendering for logs
std::string format_bytes(const std::vector<uint8_t>& bytes);

} // namespace sh1ft::utils
