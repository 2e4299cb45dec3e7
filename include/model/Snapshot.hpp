#pragma once
#include <cstddef>
#include <cstdint>
#include "model/Cpu.hpp"

namespace tasktop::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};  // total minus available
  double   used_pct{}; // 0..100
};

// System-wide readout for the header line.
struct SystemStats {
  CpuSnapshot cpu;
  Memory mem;
  size_t process_count{};
  int churn_recent{};     // vanished/denied samples in the last 2s
};

} // namespace tasktop::model
