#pragma once
#include "model/Cpu.hpp"

namespace tasktop::collectors {

// System-wide CPU busy percentage from successive /proc/stat readings.
// The first reading has nothing to compare against and reports 0.
class CpuCollector {
public:
  bool sample(tasktop::model::CpuSnapshot& out);
private:
  tasktop::model::CpuTimes last_{};
  bool primed_{false};
};

} // namespace tasktop::collectors
