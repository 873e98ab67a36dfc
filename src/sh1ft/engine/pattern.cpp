#include "pattern.hpp"
#include "utils/hex_utils.hpp"
#include <string>

namespace sh1ft::engine {

result<pattern> parse_pattern(std::string_view hex) {
  std::string hex_str(hex);
  if (!utils::is_valid_hex_pattern(hex_str)) {
    return error_result<pattern>(error_code::invalid_pattern, "invalid hex pattern");
  }

  std::string normalized = utils::normalize_hex_pattern(hex_str);
  pattern parsed;
  parsed.bytes.reserve(normalized.size() / 2);

  for (size_t i = 0; i < normalized.size(); i += 2) {
    uint8_t high = utils::parse_hex_digit(normalized[i]);
    uint8_t low = utils::parse_hex_digit(normalized[i + 1]);
    parsed.bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }

  return ok_result(std::move(parsed));
}

pattern pattern_from_string(std::string_view text) {
  pattern value;
  value.bytes.assign(text.begin(), text.end());
  return value;
}

std::string format_pattern(const pattern& value) { return utils::format_bytes(value.bytes); }

} // namespace sh1ft::engine
