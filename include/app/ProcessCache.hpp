#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "app/RefreshScheduler.hpp"
#include "collectors/IProcessSource.hpp"
#include "model/Process.hpp"
#include "util/Clock.hpp"

namespace tasktop::app {

// Tuning for the cache and the query layer, resolved once at startup.
struct ProcessOptions {
  double full_interval_s{3.0};
  double partial_interval_s{1.0};
  std::chrono::milliseconds baseline_wait{10}; // 0: new pids show their real CPU on the next pass
  bool normalize_cpu{true};
  bool hide_idle{true};                        // skip pid 0
  double cpu_change_pct{10.0};
  double mem_change_mb{50.0};
  double new_process_s{5.0};
  size_t visible_buffer{10};
  bool verbose{false};
};

struct RefreshStats {
  RefreshKind kind{RefreshKind::None};
  size_t sampled{};
  size_t added{};
  size_t dropped{};
  double elapsed_ms{};
};

// Per-process state keyed by pid. Records live in an arena kept in
// enumeration order with a pid -> slot index beside it; that order is the
// tie order the query layer's stable sort preserves.
//
// Two refresh tiers:
//   full    - re-enumerate, rebuild the arena, track births, drop the dead
//   partial - re-sample cached pids only; visible pids first with memory
//             and trends, the rest CPU only; dead pids removed after the pass
class ProcessCache {
public:
  using time_point = tasktop::util::IClock::time_point;

  ProcessCache(tasktop::collectors::IProcessSource& source, tasktop::util::IClock& clock,
               ProcessOptions opts = {});

  // Time check; runs whichever refresh is due. Returns what ran.
  RefreshKind tick();

  // Full refresh now, regardless of timers. Restarts both timers.
  void force_refresh();

  void refresh_full();
  void refresh_partial();

  [[nodiscard]] const std::vector<tasktop::model::ProcessRecord>& records() const { return records_; }
  [[nodiscard]] const tasktop::model::ProcessRecord* find(int32_t pid) const;
  [[nodiscard]] size_t size() const { return records_.size(); }

  [[nodiscard]] std::optional<time_point> birth_time(int32_t pid) const;
  [[nodiscard]] size_t birth_count() const { return birth_.size(); }

  void set_visible(std::unordered_set<int32_t> pids) { visible_ = std::move(pids); }
  [[nodiscard]] const std::unordered_set<int32_t>& visible() const { return visible_; }

  // True once after any refresh; the query layer re-sorts on it.
  [[nodiscard]] bool consume_dirty();

  [[nodiscard]] const RefreshStats& last_stats() const { return stats_; }
  [[nodiscard]] const ProcessOptions& options() const { return opts_; }
  [[nodiscard]] tasktop::util::IClock& clock() const { return clock_; }

private:
  [[nodiscard]] double normalize(double raw) const;
  void fill_new(tasktop::model::ProcessRecord& rec, const tasktop::model::RawSample& s) const;
  void update_metrics(tasktop::model::ProcessRecord& rec, const tasktop::model::RawSample& s,
                      bool with_memory, bool with_trend) const;
  void remove_pids(const std::vector<int32_t>& pids);
  void log_stats() const;

  tasktop::collectors::IProcessSource& source_;
  tasktop::util::IClock& clock_;
  ProcessOptions opts_;
  unsigned ncpu_{1};

  std::vector<tasktop::model::ProcessRecord> records_;
  std::unordered_map<int32_t, size_t> index_;
  std::unordered_map<int32_t, time_point> birth_;
  std::unordered_set<int32_t> visible_;
  RefreshScheduler sched_;
  RefreshStats stats_;
  bool populated_{false};
  bool dirty_{true};
};

} // namespace tasktop::app
