#pragma once
#include "collectors/IProcessSource.hpp"
#include "util/Clock.hpp"
#include <string>
#include <unordered_map>

namespace tasktop::collectors {

// /proc scanner. Keeps a per-pid accumulator of CPU ticks and wall-clock
// instant so the CPU rate is computed without blocking.
class ProcessCollector : public IProcessSource {
public:
  explicit ProcessCollector(tasktop::util::IClock& clock);

  [[nodiscard]] std::vector<int32_t> list_live_pids() override;
  [[nodiscard]] tasktop::model::ProcStatus sample(int32_t pid, SampleScope scope,
                                                  tasktop::model::RawSample& out) override;
  void forget(int32_t pid) override { last_per_proc_.erase(pid); }
  [[nodiscard]] unsigned logical_cpus() const override { return ncpu_; }
  [[nodiscard]] const char* name() const override { return "/proc scanner"; }

  [[nodiscard]] size_t tracked() const { return last_per_proc_.size(); }

  struct StatFields {
    char state{'?'};
    int32_t ppid{};
    uint64_t utime{};
    uint64_t stime{};
    uint64_t start_ticks{};
    int64_t rss_pages{};
    std::string comm;
  };
  static bool parse_stat_line(const std::string& content, StatFields& out);
  static const char* status_label(char state);

private:
  struct Baseline {
    uint64_t total_ticks{};
    uint64_t start_ticks{};
    tasktop::util::IClock::time_point at{};
  };

  tasktop::util::IClock& clock_;
  std::unordered_map<int32_t, Baseline> last_per_proc_{};
  unsigned ncpu_{1};
  long ticks_per_sec_{100};
  long page_kb_{4};

  static std::string long_name(int32_t pid, const std::string& comm);
};

// Logical CPUs from the per-core lines of /proc/stat (at least 1).
[[nodiscard]] unsigned read_cpu_count();

} // namespace tasktop::collectors
