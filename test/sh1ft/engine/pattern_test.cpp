#include <doctest/doctest.h>

#include "sh1ft/engine/pattern.hpp"

namespace {

using sh1ft::engine::error_code;
using sh1ft::engine::format_pattern;
using sh1ft::engine::parse_pattern;
using sh1ft::engine::pattern_from_string;

} // namespace

TEST_CASE("pattern parsing handles hex text") {
  auto parsed = parse_pattern("48 89 e5 00 ff");
  REQUIRE(parsed.ok());
  REQUIRE(parsed.value.size() == 5);
  CHECK(parsed.value[0] == 0x48);
  CHECK(parsed.value[1] == 0x89);
  CHECK(parsed.value[2] == 0xe5);
  CHECK(parsed.value[3] == 0x00);
  CHECK(parsed.value[4] == 0xff);
}

TEST_CASE("pattern parsing normalizes whitespace and case") {
  auto parsed = parse_pattern("  48\t89  E5\n90 ");
  REQUIRE(parsed.ok());
  CHECK(parsed.value.bytes == std::vector<uint8_t>{0x48, 0x89, 0xe5, 0x90});
}

TEST_CASE("pattern parsing rejects invalid hex") {
  auto bad_digit = parse_pattern("zz 90");
  CHECK_FALSE(bad_digit.ok());
  CHECK(bad_digit.status_info.code == error_code::invalid_pattern);

  auto odd = parse_pattern("489");
  CHECK(odd.status_info.code == error_code::invalid_pattern);

  auto wildcard = parse_pattern("48 ?? 90");
  CHECK(wildcard.status_info.code == error_code::invalid_pattern);

  auto empty = parse_pattern("");
  CHECK(empty.status_info.code == error_code::invalid_pattern);
}

TEST_CASE("pattern from string keeps raw bytes") {
  auto value = pattern_from_string("ab\xff");
  REQUIRE(value.size() == 3);
  CHECK(value[0] == 'a');
  CHECK(value[2] == 0xff);
  CHECK(format_pattern(value) == "61 62 ff");
  CHECK(pattern_from_string("").empty());
}
