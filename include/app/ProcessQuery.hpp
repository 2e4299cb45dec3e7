#pragma once
#include <optional>
#include <string>
#include <vector>
#include "app/ProcessCache.hpp"
#include "model/Process.hpp"

namespace tasktop::app {

// Sorted/filtered view over the process cache. One query per UI tick:
// runs the cache's time check, re-sorts only when the sort key, the
// reverse flag or the cache changed, filters by name, stamps is_new and
// hands the visible pids (plus a buffer) back to the cache.
class ProcessQuery {
public:
  explicit ProcessQuery(ProcessCache& cache);

  [[nodiscard]] std::vector<tasktop::model::ProcessRecord> query(
      tasktop::model::SortKey sort_by, bool reverse,
      std::optional<tasktop::model::VisibleRange> visible,
      const std::string& search);

  void force_refresh() {
    cache_.force_refresh();
    last_refresh_ = RefreshKind::Full;
  }

  // Diagnostics: how many times the canonical sorted view was rebuilt, and
  // whether the most recent query rebuilt it.
  [[nodiscard]] size_t sort_count() const { return sort_count_; }
  [[nodiscard]] bool last_query_resorted() const { return last_resorted_; }
  [[nodiscard]] RefreshKind last_refresh() const { return last_refresh_; }

  [[nodiscard]] const ProcessCache& cache() const { return cache_; }

private:
  void rebuild_sorted(tasktop::model::SortKey sort_by, bool reverse);
  void mark_new(std::vector<tasktop::model::ProcessRecord>& view) const;
  void update_visible(const std::vector<tasktop::model::ProcessRecord>& view,
                      const std::optional<tasktop::model::VisibleRange>& visible);

  ProcessCache& cache_;
  std::vector<tasktop::model::ProcessRecord> sorted_; // unfiltered, memoized
  std::optional<tasktop::model::SortKey> last_sort_;
  bool last_reverse_{false};
  size_t sort_count_{0};
  bool last_resorted_{false};
  RefreshKind last_refresh_{RefreshKind::None};
};

} // namespace tasktop::app
