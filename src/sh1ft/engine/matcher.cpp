#include "matcher.hpp"

namespace sh1ft::engine {

result<std::vector<size_t>> find_all(const matcher& search, std::span<const uint8_t> text, size_t max_matches) {
  std::vector<size_t> matches;

  size_t from_index = 0;
  while (from_index <= text.size()) {
    auto found = search.index_of(text, from_index);
    if (!found.ok()) {
      return error_result<std::vector<size_t>>(found.status_info.code, found.status_info.message);
    }
    if (!found.value) {
      break;
    }

    matches.push_back(*found.value);
    if (max_matches > 0 && matches.size() >= max_matches) {
      break;
    }
    from_index = *found.value + 1;
  }

  return ok_result(std::move(matches));
}

} // namespace sh1ft::engine
