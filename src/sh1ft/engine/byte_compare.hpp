#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

namespace sh1ft::engine {

// true when text[offset, offset + needle.size()) equals needle; false if the window does not fit
inline bool bytes_equal_at(std::span<const uint8_t> text, size_t offset, std::span<const uint8_t> needle) noexcept {
  if (offset > text.size() || needle.size() > text.size() - offset) {
    return false;
  }
  if (needle.empty()) {
    return true;
  }
  return std::memcmp(text.data() + offset, needle.data(), needle.size()) == 0;
}

} // namespace sh1ft::engine
