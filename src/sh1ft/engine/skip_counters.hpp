#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace sh1ft::engine {

// point-in-time copy of the skip counters
struct skip_snapshot {
  uint64_t lookups = 0;
  uint64_t compares = 0;
  uint64_t total_shift = 0;

  bool empty() const noexcept { return lookups == 0; }
  double average_shift() const noexcept;
  double compare_rate() const noexcept; // percent of lookups that forced a comparison
};

// cumulative shift-table statistics; safe to share between concurrent searches
class skip_counters {
public:
  void record(uint64_t skip) noexcept {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    total_shift_.fetch_add(skip, std::memory_order_relaxed);
    if (skip == 0) {
      compares_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  skip_snapshot snapshot() const noexcept;

  // read and zero all counters
  skip_snapshot take() noexcept;

  // summary of the counters since the last report, then reset; empty when nothing was recorded
  std::string report();

private:
  std::atomic<uint64_t> lookups_{0};
  std::atomic<uint64_t> compares_{0};
  std::atomic<uint64_t> total_shift_{0};
};

std::string format_skip_snapshot(const skip_snapshot& snapshot);

} // namespace sh1ft::engine
