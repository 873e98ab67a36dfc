#include "two_byte_hash_matcher.hpp"
#include "byte_compare.hpp"
#include <redlog.hpp>
#include <cstring>
#include <string>

namespace sh1ft::engine {

namespace {

constexpr size_t k_no_match = static_cast<size_t>(-1);

std::string algorithm_name(uint32_t hash_bits) { return "two_byte_hash_shift(p=" + std::to_string(hash_bits) + ")"; }

} // namespace

two_byte_hash_matcher::two_byte_hash_matcher(
    pattern needle, shift_table table, std::shared_ptr<skip_counters> counters
)
    : needle_(std::move(needle)), table_(std::move(table)), counters_(std::move(counters)) {}

result<match_offset> two_byte_hash_matcher::index_of(std::span<const uint8_t> text, size_t from_index) const {
  if (from_index > text.size()) {
    return error_result<match_offset>(
        error_code::invalid_argument, "from_index " + std::to_string(from_index) + " exceeds text size " +
                                          std::to_string(text.size())
    );
  }

  const size_t pattern_len = needle_.size();
  if (pattern_len == 0 || pattern_len > text.size() - from_index) {
    return ok_result(match_offset{});
  }

  size_t found = k_no_match;
  if (pattern_len == 1) {
    found = scan_single_byte(text, from_index);
  } else if (counters_) {
    found = scan<true>(text, from_index);
  } else {
    found = scan<false>(text, from_index);
  }

  if (found == k_no_match) {
    return ok_result(match_offset{});
  }
  return ok_result(match_offset{found});
}

template <bool record_skips>
size_t two_byte_hash_matcher::scan(std::span<const uint8_t> text, size_t from_index) const {
  const size_t pattern_len = needle_.size();
  const size_t offset = pattern_len - 1;
  const size_t text_len = text.size();
  const std::span<const uint8_t> needle(needle_.bytes);

  // offset >= 1 here, so text[i - 1] is always in range
  size_t i = from_index + offset;
  while (i < text_len) {
    size_t skip = table_.lookup(text[i - 1], text[i]);

    if constexpr (record_skips) {
      counters_->record(skip);
    }

    if (skip == 0) {
      if (bytes_equal_at(text, i - offset, needle)) {
        return i - offset;
      }
      // false hit, move ahead one byte
      ++i;
    }

    i += skip;
  }

  return k_no_match;
}

size_t two_byte_hash_matcher::scan_single_byte(std::span<const uint8_t> text, size_t from_index) const {
  const void* hit = std::memchr(text.data() + from_index, needle_[0], text.size() - from_index);
  if (!hit) {
    return k_no_match;
  }
  return static_cast<size_t>(static_cast<const uint8_t*>(hit) - text.data());
}

std::string two_byte_hash_matcher::describe() const { return algorithm_name(table_.hash_bits()); }

std::string two_byte_hash_matcher::stats() const {
  if (!counters_) {
    return "";
  }
  return counters_->report();
}

two_byte_hash_matcher_factory::two_byte_hash_matcher_factory(
    uint32_t hash_bits, std::shared_ptr<skip_counters> counters
)
    : hash_bits_(hash_bits), counters_(std::move(counters)) {}

result<std::unique_ptr<matcher>> two_byte_hash_matcher_factory::create(const pattern& needle) const {
  auto log = redlog::get_logger("sh1ft.matcher");

  auto table = shift_table::build(needle, hash_bits_);
  if (!table.ok()) {
    log.err("failed to create matcher", redlog::field("error", table.status_info.message));
    return error_result<std::unique_ptr<matcher>>(table.status_info.code, table.status_info.message);
  }

  int log_level = static_cast<int>(redlog::get_level());
  if (log_level >= static_cast<int>(redlog::level::trace)) {
    log.trc(
        "created matcher", redlog::field("algorithm", name()), redlog::field("pattern", format_pattern(needle)),
        redlog::field("stats", counters_ != nullptr)
    );
  }

  std::unique_ptr<matcher> created =
      std::make_unique<two_byte_hash_matcher>(needle, std::move(table.value), counters_);
  return ok_result(std::move(created));
}

std::string two_byte_hash_matcher_factory::name() const { return algorithm_name(hash_bits_); }

} // namespace sh1ft::engine
