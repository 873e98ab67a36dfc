#include "shift_table.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <limits>
#include <string>

namespace sh1ft::engine {

namespace {

shift_table::entry_type clamp_shift(size_t shift) {
  // a smaller shift is always safe, so saturating keeps the table correct for huge patterns
  constexpr size_t max_entry = std::numeric_limits<shift_table::entry_type>::max();
  return static_cast<shift_table::entry_type>(std::min(shift, max_entry));
}

} // namespace

shift_table::shift_table(uint32_t hash_bits, std::vector<entry_type> entries)
    : hash_bits_(hash_bits), entries_(std::move(entries)) {}

result<shift_table> shift_table::build(const pattern& needle, uint32_t hash_bits) {
  auto log = redlog::get_logger("sh1ft.shift_table");

  if (needle.empty()) {
    log.err("cannot build shift table for empty pattern");
    return error_result<shift_table>(error_code::invalid_argument, "pattern is empty");
  }
  if (hash_bits > k_max_hash_bits) {
    log.err(
        "hash bits out of range", redlog::field("hash_bits", hash_bits), redlog::field("max", k_max_hash_bits)
    );
    return error_result<shift_table>(
        error_code::invalid_argument, "hash bits must be at most " + std::to_string(k_max_hash_bits)
    );
  }

  const size_t pattern_len = needle.size();
  shift_table table(hash_bits, std::vector<entry_type>(slot_count(hash_bits), clamp_shift(pattern_len)));

  // windows inside the pattern, last window first; the final window gets shift 0
  for (size_t j = pattern_len - 1; j-- > 0;) {
    size_t shift = pattern_len - 2 - j;
    table.lower(table.hash(needle[j], needle[j + 1]), clamp_shift(shift));
  }

  // windows straddling the byte before the pattern start: any byte followed by pattern[0]
  const entry_type straddle_shift = clamp_shift(pattern_len - 1);
  for (size_t preceding = 0; preceding < 256; ++preceding) {
    table.lower(table.hash(static_cast<uint8_t>(preceding), needle[0]), straddle_shift);
  }

  int log_level = static_cast<int>(redlog::get_level());
  if (log_level >= static_cast<int>(redlog::level::debug)) {
    log.dbg(
        "built shift table", redlog::field("pattern_size", pattern_len), redlog::field("hash_bits", hash_bits),
        redlog::field("slots", table.size()), redlog::field("zero_slots", table.zero_slots())
    );
  }

  return ok_result(std::move(table));
}

size_t shift_table::zero_slots() const noexcept {
  return static_cast<size_t>(std::count(entries_.begin(), entries_.end(), entry_type{0}));
}

} // namespace sh1ft::engine
