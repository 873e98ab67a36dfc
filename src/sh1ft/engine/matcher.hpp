#pragma once

#include "pattern.hpp"
#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sh1ft::engine {

// match start offset, or std::nullopt when the pattern does not occur
using match_offset = std::optional<size_t>;

// a search strategy bound to one pattern
class matcher {
public:
  virtual ~matcher() = default;

  // lowest offset >= from_index where the pattern occurs in text.
  // from_index may equal text.size(); anything larger is invalid_argument.
  virtual result<match_offset> index_of(std::span<const uint8_t> text, size_t from_index) const = 0;

  // algorithm name and tuning parameters
  virtual std::string describe() const = 0;

  // performance summary of the recorded lookups, then resets the counters. empty when none were recorded.
  // counters may be shared (two_byte_hash_matcher_factory hands one set to every matcher it creates),
  // in which case the summary covers and resets the lookups of all those matchers
  virtual std::string stats() const { return ""; }

  virtual size_t pattern_size() const noexcept = 0;
};

// builds matchers of one strategy from patterns
class matcher_factory {
public:
  virtual ~matcher_factory() = default;

  // fails with invalid_argument for an empty pattern
  virtual result<std::unique_ptr<matcher>> create(const pattern& needle) const = 0;

  virtual std::string name() const = 0;
};

inline std::span<const uint8_t> as_bytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

// every occurrence in order, overlapping ones included; stops after max_matches when non-zero
result<std::vector<size_t>> find_all(const matcher& search, std::span<const uint8_t> text, size_t max_matches = 0);

} // namespace sh1ft::engine
