#pragma once
#include "model/Snapshot.hpp"

namespace tasktop::collectors {

// Used/total memory from /proc/meminfo. Kernels without MemAvailable
// (pre 3.14) fall back to free + buffers + cached.
class MemoryCollector {
public:
  bool sample(tasktop::model::Memory& out) const;
};

} // namespace tasktop::collectors
