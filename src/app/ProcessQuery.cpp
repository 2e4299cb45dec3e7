#include "app/ProcessQuery.hpp"
#include "app/Filter.hpp"
#include "util/AsciiLower.hpp"
#include <algorithm>
#include <unordered_set>

namespace tasktop::app {

using tasktop::model::ProcessRecord;
using tasktop::model::SortKey;
using tasktop::model::VisibleRange;

ProcessQuery::ProcessQuery(ProcessCache& cache) : cache_(cache) {}

static bool name_less(const std::string& a, const std::string& b) {
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y){
    return tasktop::util::ascii_lower(static_cast<unsigned char>(x)) <
           tasktop::util::ascii_lower(static_cast<unsigned char>(y));
  });
}

static bool key_less(SortKey key, const ProcessRecord& a, const ProcessRecord& b) {
  switch (key) {
    case SortKey::Cpu:    return a.cpu_pct < b.cpu_pct;
    case SortKey::Memory: return a.mem_mb < b.mem_mb;
    case SortKey::Pid:    return a.pid < b.pid;
    case SortKey::Name:   return name_less(a.name, b.name);
  }
  return false;
}

// Stable in both directions: equal keys keep cache order.
void ProcessQuery::rebuild_sorted(SortKey sort_by, bool reverse) {
  sorted_ = cache_.records();
  std::stable_sort(sorted_.begin(), sorted_.end(), [&](const ProcessRecord& a, const ProcessRecord& b){
    return reverse ? key_less(sort_by, b, a) : key_less(sort_by, a, b);
  });
  last_sort_ = sort_by;
  last_reverse_ = reverse;
  ++sort_count_;
}

void ProcessQuery::mark_new(std::vector<ProcessRecord>& view) const {
  const auto now = cache_.clock().now();
  const double window = cache_.options().new_process_s;
  for (auto& p : view) {
    auto born = cache_.birth_time(p.pid);
    p.is_new = born && tasktop::util::seconds_between(*born, now) < window;
  }
}

void ProcessQuery::update_visible(const std::vector<ProcessRecord>& view,
                                  const std::optional<VisibleRange>& visible) {
  std::unordered_set<int32_t> pids;
  if (visible && !view.empty()) {
    const size_t buffer = cache_.options().visible_buffer;
    const size_t end = std::min(visible->end, view.size());
    size_t lo = visible->start > buffer ? visible->start - buffer : 0;
    size_t hi = std::min(view.size(), end + buffer);
    for (size_t i = lo; i < hi; ++i) pids.insert(view[i].pid);
  }
  cache_.set_visible(std::move(pids));
}

std::vector<ProcessRecord> ProcessQuery::query(SortKey sort_by, bool reverse,
                                               std::optional<VisibleRange> visible,
                                               const std::string& search) {
  last_refresh_ = cache_.tick();
  const bool changed = cache_.consume_dirty();
  last_resorted_ = changed || !last_sort_ || *last_sort_ != sort_by || last_reverse_ != reverse;
  if (last_resorted_) rebuild_sorted(sort_by, reverse);

  // Filtered results are never memoized; sorted_ stays the full list
  ProcessFilter filter(search);
  std::vector<ProcessRecord> view = filter.active() ? filter.apply(sorted_) : sorted_;
  mark_new(view);
  update_visible(view, visible);
  return view;
}

} // namespace tasktop::app
