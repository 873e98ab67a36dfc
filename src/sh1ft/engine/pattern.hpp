#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sh1ft::engine {

// exact byte sequence to search for
struct pattern {
  std::vector<uint8_t> bytes;

  size_t size() const noexcept { return bytes.size(); }
  bool empty() const noexcept { return bytes.empty(); }
  uint8_t operator[](size_t index) const noexcept { return bytes[index]; }
};

// parse "48 89 e5" style hex text; whitespace and comments are ignored
result<pattern> parse_pattern(std::string_view hex);

// raw bytes of a string, no escaping
pattern pattern_from_string(std::string_view text);

std::string format_pattern(const pattern& value);

} // namespace sh1ft::engine
