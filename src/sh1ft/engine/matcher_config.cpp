#include "matcher_config.hpp"
#include <redlog.hpp>

namespace sh1ft::engine {

matcher_config load_matcher_config() { return load_matcher_config(utils::env_config("SH1FT")); }

matcher_config load_matcher_config(const utils::env_config& env) {
  auto log = redlog::get_logger("sh1ft.config");

  matcher_config config;
  config.hash_bits = env.get<uint32_t>("HASH_BITS", shift_table::k_default_hash_bits);
  config.collect_stats = env.get<bool>("STATS", false);

  if (config.hash_bits > shift_table::k_max_hash_bits) {
    log.wrn(
        "hash bits out of range, using default", redlog::field("name", env.env_name("HASH_BITS")),
        redlog::field("hash_bits", config.hash_bits), redlog::field("max", shift_table::k_max_hash_bits)
    );
    config.hash_bits = shift_table::k_default_hash_bits;
  }

  log.dbg(
      "loaded matcher config", redlog::field("hash_bits", config.hash_bits),
      redlog::field("collect_stats", config.collect_stats)
  );
  return config;
}

std::unique_ptr<two_byte_hash_matcher_factory> make_matcher_factory(const matcher_config& config) {
  std::shared_ptr<skip_counters> counters;
  if (config.collect_stats) {
    counters = std::make_shared<skip_counters>();
  }
  return std::make_unique<two_byte_hash_matcher_factory>(config.hash_bits, std::move(counters));
}

} // namespace sh1ft::engine
