#pragma once

#include "shift_table.hpp"
#include "two_byte_hash_matcher.hpp"
#include "utils/env_config.hpp"
#include <cstdint>
#include <memory>

namespace sh1ft::engine {

struct matcher_config {
  uint32_t hash_bits = shift_table::k_default_hash_bits;
  bool collect_stats = false;
};

// reads SH1FT_HASH_BITS and SH1FT_STATS; out of range hash bits fall back to the default
matcher_config load_matcher_config();
matcher_config load_matcher_config(const utils::env_config& env);

std::unique_ptr<two_byte_hash_matcher_factory> make_matcher_factory(const matcher_config& config);

} // namespace sh1ft::engine
