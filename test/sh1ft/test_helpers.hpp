#pragma once

#include "sh1ft/engine/pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string_view>
#include <vector>

namespace sh1ft::test_helpers {

inline std::vector<uint8_t> make_buffer(size_t size, uint8_t fill = 0x90) { return std::vector<uint8_t>(size, fill); }

inline void write_bytes(std::vector<uint8_t>& buffer, size_t offset, std::initializer_list<uint8_t> bytes) {
  if (offset >= buffer.size()) {
    return;
  }
  size_t count = std::min(buffer.size() - offset, bytes.size());
  std::copy(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(count), buffer.begin() + offset);
}

inline engine::pattern make_pattern(std::initializer_list<uint8_t> bytes) { return engine::pattern{bytes}; }

inline engine::pattern make_pattern(std::string_view text) { return engine::pattern_from_string(text); }

// bytes drawn uniformly from [0, alphabet)
inline std::vector<uint8_t> random_bytes(std::mt19937& rng, size_t size, unsigned alphabet) {
  std::uniform_int_distribution<unsigned> dist(0, alphabet - 1);
  std::vector<uint8_t> out(size);
  for (auto& byte : out) {
    byte = static_cast<uint8_t>(dist(rng));
  }
  return out;
}

} // namespace sh1ft::test_helpers
