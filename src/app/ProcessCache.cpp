#include "app/ProcessCache.hpp"
#include "app/Trend.hpp"
#include "util/Churn.hpp"
#include <algorithm>
#include <cstdio>

namespace tasktop::app {

using tasktop::collectors::SampleScope;
using tasktop::model::ProcStatus;
using tasktop::model::ProcessRecord;
using tasktop::model::RawSample;
using tasktop::model::Trend;

static constexpr double kBytesPerMiB = 1024.0 * 1024.0;

static void note_failure(ProcStatus st) {
  if (st == ProcStatus::NotFound) tasktop::util::note_churn(tasktop::util::ChurnKind::Vanished);
  else if (st == ProcStatus::AccessDenied) tasktop::util::note_churn(tasktop::util::ChurnKind::Denied);
}

ProcessCache::ProcessCache(tasktop::collectors::IProcessSource& source, tasktop::util::IClock& clock,
                           ProcessOptions opts)
    : source_(source), clock_(clock), opts_(opts) {
  ncpu_ = std::max(1u, source_.logical_cpus());
  sched_.full_interval_s = opts_.full_interval_s;
  sched_.partial_interval_s = opts_.partial_interval_s;
}

RefreshKind ProcessCache::tick() {
  switch (sched_.due(clock_.now())) {
    case RefreshKind::Full:
      refresh_full();
      return RefreshKind::Full;
    case RefreshKind::Partial:
      refresh_partial();
      return RefreshKind::Partial;
    case RefreshKind::None:
      break;
  }
  return RefreshKind::None;
}

void ProcessCache::force_refresh() {
  refresh_full();
}

bool ProcessCache::consume_dirty() {
  bool d = dirty_;
  dirty_ = false;
  return d;
}

const ProcessRecord* ProcessCache::find(int32_t pid) const {
  auto it = index_.find(pid);
  return it == index_.end() ? nullptr : &records_[it->second];
}

std::optional<ProcessCache::time_point> ProcessCache::birth_time(int32_t pid) const {
  auto it = birth_.find(pid);
  if (it == birth_.end()) return std::nullopt;
  return it->second;
}

double ProcessCache::normalize(double raw) const {
  return opts_.normalize_cpu ? raw / static_cast<double>(ncpu_) : raw;
}

void ProcessCache::fill_new(ProcessRecord& rec, const RawSample& s) const {
  rec.pid = s.pid;
  rec.name = s.name.empty() ? std::string("N/A") : s.name;
  rec.status = s.status;
  rec.cpu_pct = normalize(s.cpu_pct_raw);
  rec.mem_mb = static_cast<double>(s.rss_bytes) / kBytesPerMiB;
  rec.start_ticks = s.start_ticks;
  rec.cpu_trend = Trend::Stable;
  rec.mem_trend = Trend::Stable;
  rec.prev_cpu.reset();
  rec.prev_mem.reset();
}

void ProcessCache::update_metrics(ProcessRecord& rec, const RawSample& s, bool with_memory, bool with_trend) const {
  const double cpu = normalize(s.cpu_pct_raw);
  if (with_trend) {
    rec.prev_cpu = rec.cpu_pct;
    rec.cpu_trend = compute_trend(rec.cpu_pct, cpu, opts_.cpu_change_pct);
  }
  rec.cpu_pct = cpu;
  if (!with_memory) return;
  const double mem = static_cast<double>(s.rss_bytes) / kBytesPerMiB;
  if (with_trend) {
    rec.prev_mem = rec.mem_mb;
    rec.mem_trend = compute_trend(rec.mem_mb, mem, opts_.mem_change_mb);
  }
  rec.mem_mb = mem;
  if (!s.name.empty()) rec.name = s.name;
  if (!s.status.empty()) rec.status = s.status;
}

void ProcessCache::refresh_full() {
  const auto now = clock_.now();
  // Processes seen by the first pass predate the cache and get no birth time
  const bool initial = !populated_;
  RefreshStats stats{RefreshKind::Full, 0, 0, 0, 0.0};

  std::vector<ProcessRecord> next;
  next.reserve(records_.size() + 16);
  std::unordered_map<int32_t, size_t> next_index;
  next_index.reserve(records_.size() + 16);
  std::vector<size_t> fresh; // slots waiting for their second CPU sample

  for (int32_t pid : source_.list_live_pids()) {
    if (opts_.hide_idle && pid == 0) continue;
    if (next_index.count(pid)) continue;
    RawSample s;
    auto st = source_.sample(pid, SampleScope::Full, s);
    ++stats.sampled;
    if (st != ProcStatus::Ok) { note_failure(st); continue; }
    s.pid = pid;

    const ProcessRecord* prior = find(pid);
    if (prior && prior->start_ticks != s.start_ticks) prior = nullptr; // pid reused

    ProcessRecord rec;
    if (prior) {
      rec = *prior;
      update_metrics(rec, s, true, true);
    } else {
      fill_new(rec, s);
      fresh.push_back(next.size());
      if (initial) birth_.erase(pid);
      else birth_[pid] = now;
      ++stats.added;
    }
    next_index.emplace(pid, next.size());
    next.push_back(std::move(rec));
  }

  // One bounded wait shared by every new pid, then the real rate
  if (!fresh.empty() && opts_.baseline_wait.count() > 0) {
    clock_.sleep_for(opts_.baseline_wait);
    for (size_t slot : fresh) {
      auto& rec = next[slot];
      RawSample s;
      auto st = source_.sample(rec.pid, SampleScope::CpuOnly, s);
      if (st == ProcStatus::Ok && s.start_ticks == rec.start_ticks) rec.cpu_pct = normalize(s.cpu_pct_raw);
      else note_failure(st);
    }
  }

  for (const auto& r : records_) {
    if (next_index.count(r.pid)) continue;
    source_.forget(r.pid);
    ++stats.dropped;
  }
  std::erase_if(birth_, [&](const auto& kv){ return next_index.count(kv.first) == 0; });
  std::erase_if(visible_, [&](int32_t pid){ return next_index.count(pid) == 0; });

  records_.swap(next);
  index_.swap(next_index);
  populated_ = true;
  dirty_ = true;
  sched_.mark_full(now);
  stats.elapsed_ms = std::chrono::duration<double, std::milli>(clock_.now() - now).count();
  stats_ = stats;
  log_stats();
}

void ProcessCache::refresh_partial() {
  const auto now = clock_.now();
  RefreshStats stats{RefreshKind::Partial, 0, 0, 0, 0.0};
  std::vector<int32_t> removals;

  auto visit = [&](ProcessRecord& rec, bool visible) {
    RawSample s;
    auto st = source_.sample(rec.pid, visible ? SampleScope::Full : SampleScope::CpuOnly, s);
    ++stats.sampled;
    if (st == ProcStatus::NotFound || (st == ProcStatus::Ok && s.start_ticks != rec.start_ticks)) {
      note_failure(ProcStatus::NotFound);
      removals.push_back(rec.pid);
      return;
    }
    if (st != ProcStatus::Ok) { note_failure(st); return; } // keep the stale record
    update_metrics(rec, s, visible, visible);
  };

  if (!visible_.empty()) {
    for (auto& rec : records_) if (visible_.count(rec.pid)) visit(rec, true);
  }
  for (auto& rec : records_) if (!visible_.count(rec.pid)) visit(rec, false);

  if (!removals.empty()) remove_pids(removals);
  stats.dropped = removals.size();

  dirty_ = true;
  sched_.mark_partial(now);
  stats.elapsed_ms = std::chrono::duration<double, std::milli>(clock_.now() - now).count();
  stats_ = stats;
  log_stats();
}

// Deferred so the passes above never mutate the arena they iterate.
void ProcessCache::remove_pids(const std::vector<int32_t>& pids) {
  std::unordered_set<int32_t> dead(pids.begin(), pids.end());
  std::erase_if(records_, [&](const ProcessRecord& r){ return dead.count(r.pid) != 0; });
  index_.clear();
  for (size_t i = 0; i < records_.size(); ++i) index_.emplace(records_[i].pid, i);
  for (int32_t pid : dead) {
    visible_.erase(pid);
    birth_.erase(pid);
    source_.forget(pid);
  }
}

void ProcessCache::log_stats() const {
  if (!opts_.verbose) return;
  std::fprintf(stderr, "tasktop: %s refresh: %zu sampled, %zu tracked (+%zu -%zu) in %.1fms\n",
               stats_.kind == RefreshKind::Full ? "full" : "partial",
               stats_.sampled, records_.size(), stats_.added, stats_.dropped, stats_.elapsed_ms);
}

} // namespace tasktop::app
