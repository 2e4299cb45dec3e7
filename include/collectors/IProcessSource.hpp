#pragma once
#include <cstdint>
#include <vector>
#include "model/Process.hpp"

namespace tasktop::collectors {

enum class SampleScope { CpuOnly, Full };

// Minimal interface for process snapshot sources so the cache can run
// against /proc or a scripted source in tests.
//
// cpu_pct_raw is differential: the first sample of a pid establishes the
// baseline and reports 0; later samples report CPU time consumed since the
// previous sample of that pid divided by wall-clock elapsed. Each sample
// call advances the pid's baseline.
class IProcessSource {
public:
  virtual ~IProcessSource() = default;

  // All pids currently alive, in enumeration order.
  [[nodiscard]] virtual std::vector<int32_t> list_live_pids() = 0;

  // Read one process. out.name/status/rss_bytes are only filled for Full.
  [[nodiscard]] virtual tasktop::model::ProcStatus sample(int32_t pid, SampleScope scope,
                                                          tasktop::model::RawSample& out) = 0;

  // Drop per-pid baseline state once the cache no longer tracks the pid.
  virtual void forget(int32_t pid) { (void)pid; }

  [[nodiscard]] virtual unsigned logical_cpus() const = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace tasktop::collectors
