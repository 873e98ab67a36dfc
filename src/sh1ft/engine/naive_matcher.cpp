#include "naive_matcher.hpp"
#include "byte_compare.hpp"
#include <string>

namespace sh1ft::engine {

naive_matcher::naive_matcher(pattern needle) : needle_(std::move(needle)) {}

result<match_offset> naive_matcher::index_of(std::span<const uint8_t> text, size_t from_index) const {
  if (from_index > text.size()) {
    return error_result<match_offset>(
        error_code::invalid_argument, "from_index " + std::to_string(from_index) + " exceeds text size " +
                                          std::to_string(text.size())
    );
  }

  const std::span<const uint8_t> needle(needle_.bytes);
  for (size_t pos = from_index; pos + needle.size() <= text.size(); ++pos) {
    if (bytes_equal_at(text, pos, needle)) {
      return ok_result(match_offset{pos});
    }
  }

  return ok_result(match_offset{});
}

result<std::unique_ptr<matcher>> naive_matcher_factory::create(const pattern& needle) const {
  if (needle.empty()) {
    return error_result<std::unique_ptr<matcher>>(error_code::invalid_argument, "pattern is empty");
  }

  std::unique_ptr<matcher> created = std::make_unique<naive_matcher>(needle);
  return ok_result(std::move(created));
}

} // namespace sh1ft::engine
