#pragma once

#include "matcher.hpp"
#include "shift_table.hpp"
#include "skip_counters.hpp"
#include <memory>

namespace sh1ft::engine {

// horspool-style matcher that reads two bytes per step and skips by a hashed shift table.
//
// the cursor tracks the last byte of the candidate alignment. a zero shift means the two bytes may
// end an occurrence and the full window is compared; any other value is a safe skip. single byte
// patterns have no two-byte context and are searched with a plain byte scan instead.
class two_byte_hash_matcher final : public matcher {
public:
  two_byte_hash_matcher(pattern needle, shift_table table, std::shared_ptr<skip_counters> counters = nullptr);

  result<match_offset> index_of(std::span<const uint8_t> text, size_t from_index) const override;

  std::string describe() const override;

  std::string stats() const override;

  size_t pattern_size() const noexcept override { return needle_.size(); }

private:
  template <bool record_skips> size_t scan(std::span<const uint8_t> text, size_t from_index) const;
  size_t scan_single_byte(std::span<const uint8_t> text, size_t from_index) const;

  pattern needle_;
  shift_table table_;
  std::shared_ptr<skip_counters> counters_;
};

class two_byte_hash_matcher_factory final : public matcher_factory {
public:
  // counters, when given, are shared by every matcher this factory creates
  explicit two_byte_hash_matcher_factory(
      uint32_t hash_bits = shift_table::k_default_hash_bits, std::shared_ptr<skip_counters> counters = nullptr
  );

  result<std::unique_ptr<matcher>> create(const pattern& needle) const override;

  std::string name() const override;

  uint32_t hash_bits() const noexcept { return hash_bits_; }
  const std::shared_ptr<skip_counters>& counters() const noexcept { return counters_; }

private:
  uint32_t hash_bits_;
  std::shared_ptr<skip_counters> counters_;
};

} // namespace sh1ft::engine
