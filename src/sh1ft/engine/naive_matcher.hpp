#pragma once

#include "matcher.hpp"

namespace sh1ft::engine {

// compares the pattern at every offset; the reference every other strategy must agree with
class naive_matcher final : public matcher {
public:
  explicit naive_matcher(pattern needle);

  result<match_offset> index_of(std::span<const uint8_t> text, size_t from_index) const override;

  std::string describe() const override { return "naive"; }

  size_t pattern_size() const noexcept override { return needle_.size(); }

private:
  pattern needle_;
};

class naive_matcher_factory final : public matcher_factory {
public:
  result<std::unique_ptr<matcher>> create(const pattern& needle) const override;

  std::string name() const override { return "naive"; }
};

} // namespace sh1ft::engine
