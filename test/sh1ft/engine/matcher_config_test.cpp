#include <doctest/doctest.h>

#include "sh1ft/engine/matcher_config.hpp"
#include "sh1ft/engine/shift_table.hpp"
#include "sh1ft/test_helpers.hpp"

#include <cstdlib>

namespace {

using sh1ft::engine::load_matcher_config;
using sh1ft::engine::make_matcher_factory;
using sh1ft::engine::matcher_config;
using sh1ft::engine::shift_table;
using sh1ft::utils::env_config;

constexpr const char* k_prefix = "SH1FT_CONFIG_TEST";

struct scoped_env {
  scoped_env(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~scoped_env() { ::unsetenv(name_); }

  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;

private:
  const char* name_;
};

} // namespace

TEST_CASE("matcher config defaults without environment") {
  auto config = load_matcher_config(env_config(k_prefix));
  CHECK(config.hash_bits == shift_table::k_default_hash_bits);
  CHECK_FALSE(config.collect_stats);
}

TEST_CASE("matcher config reads hash bits and stats from the environment") {
  scoped_env bits("SH1FT_CONFIG_TEST_HASH_BITS", "7");
  scoped_env stats("SH1FT_CONFIG_TEST_STATS", "on");

  auto config = load_matcher_config(env_config(k_prefix));
  CHECK(config.hash_bits == 7);
  CHECK(config.collect_stats);
}

TEST_CASE("matcher config falls back on out of range hash bits") {
  scoped_env bits("SH1FT_CONFIG_TEST_HASH_BITS", "40");
  auto config = load_matcher_config(env_config(k_prefix));
  CHECK(config.hash_bits == shift_table::k_default_hash_bits);
}

TEST_CASE("matcher config falls back on unparsable values") {
  scoped_env bits("SH1FT_CONFIG_TEST_HASH_BITS", "wide");
  scoped_env stats("SH1FT_CONFIG_TEST_STATS", "maybe");

  auto config = load_matcher_config(env_config(k_prefix));
  CHECK(config.hash_bits == shift_table::k_default_hash_bits);
  CHECK_FALSE(config.collect_stats);
}

TEST_CASE("matcher factory from config wires counters only when requested") {
  matcher_config config;
  config.hash_bits = 2;

  auto plain = make_matcher_factory(config);
  CHECK(plain->hash_bits() == 2);
  CHECK(plain->counters() == nullptr);

  config.collect_stats = true;
  auto counted = make_matcher_factory(config);
  REQUIRE(counted->counters() != nullptr);

  auto created = counted->create(sh1ft::test_helpers::make_pattern("ab"));
  REQUIRE(created.ok());
  auto found = created.value->index_of(sh1ft::engine::as_bytes("xxab"), 0);
  REQUIRE(found.ok());
  CHECK_FALSE(created.value->stats().empty());
}
