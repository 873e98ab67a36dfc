#pragma once

#include "pattern.hpp"
#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sh1ft::engine {

// hashed two-byte shift table.
//
// each slot holds the largest distance the scan cursor may advance when the two bytes ending at the
// cursor hash to that slot. slots shared by several windows keep the smallest of their shifts, so a
// collision can only make the scan slower, never skip an occurrence.
class shift_table {
public:
  using entry_type = uint32_t;

  static constexpr uint32_t k_default_hash_bits = 4;
  static constexpr uint32_t k_max_hash_bits = 16;

  shift_table() = default;

  // build the table for a non-empty pattern with 256 << hash_bits slots
  static result<shift_table> build(const pattern& needle, uint32_t hash_bits);

  static constexpr size_t slot_count(uint32_t hash_bits) noexcept { return size_t{256} << hash_bits; }

  size_t hash(uint8_t first, uint8_t second) const noexcept {
    return (static_cast<size_t>(first) << hash_bits_) ^ static_cast<size_t>(second);
  }

  entry_type lookup(uint8_t first, uint8_t second) const noexcept { return entries_[hash(first, second)]; }

  entry_type at(size_t slot) const { return entries_.at(slot); }

  uint32_t hash_bits() const noexcept { return hash_bits_; }
  size_t size() const noexcept { return entries_.size(); }

  // number of slots that force a full comparison
  size_t zero_slots() const noexcept;

private:
  shift_table(uint32_t hash_bits, std::vector<entry_type> entries);

  // store min(current, shift); never raises a slot
  void lower(size_t slot, entry_type shift) noexcept {
    if (entries_[slot] > shift) {
      entries_[slot] = shift;
    }
  }

  uint32_t hash_bits_ = k_default_hash_bits;
  std::vector<entry_type> entries_;
};

} // namespace sh1ft::engine
