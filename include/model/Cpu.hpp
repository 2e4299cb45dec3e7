#pragma once
#include <cstdint>

namespace tasktop::model {

// Jiffies from the aggregate "cpu" line of /proc/stat. Idle includes iowait.
struct CpuTimes {
  uint64_t busy{};
  uint64_t idle{};
  uint64_t total() const { return busy + idle; }
};

struct CpuSnapshot {
  CpuTimes times{};
  double usage_pct{};      // since the previous sample, 0..100
  int logical_threads{1};  // "cpuN" lines
};

} // namespace tasktop::model
