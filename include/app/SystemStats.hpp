#pragma once
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Snapshot.hpp"

namespace tasktop::app {

// Header-line readout: CPU and memory totals plus recent process churn.
// The first CPU reading has no delta and reports 0%.
class SystemStatsSampler {
public:
  // Returns false when neither /proc/stat nor /proc/meminfo could be read.
  bool sample(size_t process_count, tasktop::model::SystemStats& out);

private:
  tasktop::collectors::CpuCollector cpu_;
  tasktop::collectors::MemoryCollector mem_;
};

} // namespace tasktop::app
