#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tasktop::model {

// Outcome of a single OS call against one process. Every /proc call site
// maps its errno into one of these.
enum class ProcStatus : uint8_t {
  Ok,
  NotFound,      // exited between enumeration and the call
  AccessDenied,  // EACCES / EPERM
  Other
};

enum class Trend : uint8_t { Stable, Rising, Falling };

enum class SortKey : uint8_t { Cpu, Memory, Pid, Name };

// Raw per-process reading straight from the snapshot source.
struct RawSample {
  int32_t  pid{};
  int32_t  ppid{};
  std::string name;        // empty when not refreshed (CpuOnly scope)
  std::string status;
  double   cpu_pct_raw{};  // since the previous sample of this pid; 0 on first sample
  uint64_t rss_bytes{};
  uint64_t start_ticks{};  // /proc/<pid>/stat field 22, identifies the process across pid reuse
};

struct ProcessRecord {
  int32_t pid{};
  std::string name{"N/A"};
  double cpu_pct{};        // normalized per core when configured
  double mem_mb{};         // resident set size
  std::string status;
  bool is_new{false};      // recomputed on every query
  Trend cpu_trend{Trend::Stable};
  Trend mem_trend{Trend::Stable};
  std::optional<double> prev_cpu;
  std::optional<double> prev_mem;
  uint64_t start_ticks{};
};

struct ThreadRecord {
  int32_t tid{};
  double user_s{};
  double system_s{};
};

// [start, end) into the list last returned by a query
struct VisibleRange {
  size_t start{};
  size_t end{};
};

[[nodiscard]] const char* to_string(ProcStatus s);
[[nodiscard]] const char* to_string(SortKey k);

} // namespace tasktop::model
