#include "skip_counters.hpp"
#include <iomanip>
#include <sstream>

namespace sh1ft::engine {

double skip_snapshot::average_shift() const noexcept {
  if (lookups == 0) {
    return 0.0;
  }
  return static_cast<double>(total_shift) / static_cast<double>(lookups);
}

double skip_snapshot::compare_rate() const noexcept {
  if (lookups == 0) {
    return 0.0;
  }
  return static_cast<double>(compares) * 100.0 / static_cast<double>(lookups);
}

skip_snapshot skip_counters::snapshot() const noexcept {
  skip_snapshot snap;
  snap.lookups = lookups_.load(std::memory_order_relaxed);
  snap.compares = compares_.load(std::memory_order_relaxed);
  snap.total_shift = total_shift_.load(std::memory_order_relaxed);
  return snap;
}

skip_snapshot skip_counters::take() noexcept {
  skip_snapshot snap;
  snap.lookups = lookups_.exchange(0, std::memory_order_relaxed);
  snap.compares = compares_.exchange(0, std::memory_order_relaxed);
  snap.total_shift = total_shift_.exchange(0, std::memory_order_relaxed);
  return snap;
}

std::string skip_counters::report() { return format_skip_snapshot(take()); }

std::string format_skip_snapshot(const skip_snapshot& snapshot) {
  if (snapshot.empty()) {
    return "";
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << "lookups=" << snapshot.lookups
      << " compare_rate=" << snapshot.compare_rate() << "% avg_shift=" << snapshot.average_shift();
  return oss.str();
}

} // namespace sh1ft::engine
