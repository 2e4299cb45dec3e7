#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ProcessQuery.hpp"
#include <limits>

using tasktop::app::ProcessCache;
using tasktop::app::ProcessOptions;
using tasktop::app::ProcessQuery;
using tasktop::app::RefreshKind;
using tasktop::model::ProcessRecord;
using tasktop::model::SortKey;
using tasktop::model::VisibleRange;
using testing_fakes::FakeClock;
using testing_fakes::ScriptedProc;
using testing_fakes::ScriptedSource;

static std::vector<int32_t> pids_of(const std::vector<ProcessRecord>& v) {
  std::vector<int32_t> out;
  for (const auto& p : v) out.push_back(p.pid);
  return out;
}

TEST(query_orders_by_cpu_descending) {
  FakeClock clock; ScriptedSource src;
  src.add(100, ScriptedProc{.name = "low", .rate = 20.0});
  src.add(200, ScriptedProc{.name = "high", .rate = 90.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  auto rows = q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{200, 100}));
  rows = q.query(SortKey::Cpu, false, std::nullopt, "");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{100, 200}));
}

TEST(query_sort_is_stable_for_ties) {
  FakeClock clock; ScriptedSource src;
  src.add(30, ScriptedProc{.name = "c", .rate = 10.0});
  src.add(10, ScriptedProc{.name = "a", .rate = 10.0});
  src.add(20, ScriptedProc{.name = "b", .rate = 10.0});
  src.add(40, ScriptedProc{.name = "d", .rate = 50.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  auto rows = q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{40, 30, 10, 20}));
  rows = q.query(SortKey::Cpu, false, std::nullopt, "");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{30, 10, 20, 40}));
}

TEST(query_sorts_by_pid_memory_and_name) {
  FakeClock clock; ScriptedSource src;
  src.add(7, ScriptedProc{.name = "beta", .rss_bytes = 3 << 20});
  src.add(3, ScriptedProc{.name = "Alpha", .rss_bytes = 9 << 20});
  src.add(5, ScriptedProc{.name = "gamma", .rss_bytes = 1 << 20});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  ASSERT_TRUE(pids_of(q.query(SortKey::Pid, false, std::nullopt, "")) == (std::vector<int32_t>{3, 5, 7}));
  ASSERT_TRUE(pids_of(q.query(SortKey::Memory, true, std::nullopt, "")) == (std::vector<int32_t>{3, 7, 5}));
  // Names compare without regard to case
  ASSERT_TRUE(pids_of(q.query(SortKey::Name, false, std::nullopt, "")) == (std::vector<int32_t>{3, 7, 5}));
  ASSERT_TRUE(pids_of(q.query(SortKey::Name, true, std::nullopt, "")) == (std::vector<int32_t>{5, 7, 3}));
}

TEST(query_memoizes_sorted_view_until_something_changes) {
  FakeClock clock; ScriptedSource src;
  src.add(100, ScriptedProc{.name = "a", .rate = 5.0});
  src.add(200, ScriptedProc{.name = "b", .rate = 15.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  auto first = q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_TRUE(q.last_query_resorted());
  auto sorts = q.sort_count();
  auto second = q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_FALSE(q.last_query_resorted());
  ASSERT_EQ(q.sort_count(), sorts);
  ASSERT_TRUE(pids_of(first) == pids_of(second));

  // A different key or direction re-sorts without a refresh
  (void)q.query(SortKey::Cpu, false, std::nullopt, "");
  ASSERT_TRUE(q.last_query_resorted());
  ASSERT_TRUE(q.last_refresh() == RefreshKind::None);
  (void)q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_TRUE(q.last_query_resorted());

  // A refresh re-sorts
  clock.advance(1.0);
  (void)q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_TRUE(q.last_refresh() == RefreshKind::Partial);
  ASSERT_TRUE(q.last_query_resorted());
}

TEST(query_forced_refresh_invalidates_view) {
  FakeClock clock; ScriptedSource src;
  src.add(100, ScriptedProc{.name = "a", .rate = 5.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  (void)q.query(SortKey::Cpu, true, std::nullopt, "");
  (void)q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_FALSE(q.last_query_resorted());
  src.add(200, ScriptedProc{.name = "b", .rate = 50.0});
  q.force_refresh();
  ASSERT_TRUE(q.last_refresh() == RefreshKind::Full);
  auto rows = q.query(SortKey::Cpu, true, std::nullopt, "");
  ASSERT_TRUE(q.last_query_resorted());
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{200, 100}));
}

TEST(query_search_matches_case_insensitive_substring) {
  FakeClock clock; ScriptedSource src;
  src.add(1, ScriptedProc{.name = "chrome", .rate = 10.0});
  src.add(2, ScriptedProc{.name = "explorer", .rate = 20.0});
  src.add(3, ScriptedProc{.name = "Chromium", .rate = 30.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  auto rows = q.query(SortKey::Cpu, true, std::nullopt, "chr");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{3, 1}));
  rows = q.query(SortKey::Cpu, true, std::nullopt, "CHR");
  ASSERT_TRUE(pids_of(rows) == (std::vector<int32_t>{3, 1}));
  // Blank search shows everything
  rows = q.query(SortKey::Cpu, true, std::nullopt, "   ");
  ASSERT_EQ(rows.size(), 3u);
}

TEST(query_filtered_results_are_repeatable) {
  FakeClock clock; ScriptedSource src;
  src.add(1, ScriptedProc{.name = "bash", .rate = 10.0});
  src.add(2, ScriptedProc{.name = "zsh", .rate = 10.0});
  src.add(3, ScriptedProc{.name = "sshd", .rate = 10.0});
  ProcessCache cache(src, clock);
  ProcessQuery q(cache);
  auto a = q.query(SortKey::Cpu, true, std::nullopt, "sh");
  auto b = q.query(SortKey::Cpu, true, std::nullopt, "sh");
  ASSERT_TRUE(pids_of(a) == pids_of(b));
  ASSERT_EQ(a.size(), 3u);
  // Narrowing then clearing the search gets the full list back
  ASSERT_EQ(q.query(SortKey::Cpu, true, std::nullopt, "ssh").size(), 1u);
  ASSERT_EQ(q.query(SortKey::Cpu, true, std::nullopt, "").size(), 3u);
}

TEST(query_is_new_expires_without_full_refresh) {
  FakeClock clock; ScriptedSource src;
  src.add(100, ScriptedProc{.name = "old", .rate = 1.0});
  ProcessOptions opts;
  opts.full_interval_s = 100.0;
  opts.partial_interval_s = 100.0;
  ProcessCache cache(src, clock, opts);
  ProcessQuery q(cache);
  (void)q.query(SortKey::Pid, false, std::nullopt, "");

  src.add(300, ScriptedProc{.name = "fresh", .rate = 12.0});
  q.force_refresh();
  auto rows = q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_FALSE(rows[0].is_new);
  ASSERT_TRUE(rows[1].is_new);
  ASSERT_NEAR(rows[1].cpu_pct, 12.0, 1e-9);

  clock.advance(4.9);
  rows = q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_TRUE(q.last_refresh() == RefreshKind::None);
  ASSERT_TRUE(rows[1].is_new);

  clock.advance(0.2);
  rows = q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_TRUE(q.last_refresh() == RefreshKind::None);
  ASSERT_FALSE(rows[1].is_new);
}

TEST(query_visible_range_expands_by_buffer) {
  FakeClock clock; ScriptedSource src;
  for (int32_t pid = 1; pid <= 10; ++pid) src.add(pid, ScriptedProc{.name = "p", .rate = 1.0});
  ProcessOptions opts; opts.visible_buffer = 2;
  ProcessCache cache(src, clock, opts);
  ProcessQuery q(cache);
  (void)q.query(SortKey::Pid, false, VisibleRange{4, 6}, "");
  const auto& vis = cache.visible();
  ASSERT_EQ(vis.size(), 6u);
  for (int32_t pid = 3; pid <= 8; ++pid) ASSERT_EQ(vis.count(pid), 1u);

  (void)q.query(SortKey::Pid, false, VisibleRange{0, 2}, "");
  ASSERT_EQ(cache.visible().size(), 4u);
  ASSERT_EQ(cache.visible().count(1), 1u);
  ASSERT_EQ(cache.visible().count(4), 1u);

  (void)q.query(SortKey::Pid, false, VisibleRange{9, 10}, "");
  ASSERT_EQ(cache.visible().size(), 3u);

  (void)q.query(SortKey::Pid, false, std::nullopt, "");
  ASSERT_TRUE(cache.visible().empty());
}

TEST(query_visible_range_end_past_list_is_clamped) {
  FakeClock clock; ScriptedSource src;
  for (int32_t pid = 1; pid <= 10; ++pid) src.add(pid, ScriptedProc{.name = "p", .rate = 1.0});
  ProcessOptions opts; opts.visible_buffer = 2;
  ProcessCache cache(src, clock, opts);
  ProcessQuery q(cache);
  (void)q.query(SortKey::Pid, false, VisibleRange{7, std::numeric_limits<size_t>::max()}, "");
  ASSERT_EQ(cache.visible().size(), 5u);
  for (int32_t pid = 6; pid <= 10; ++pid) ASSERT_EQ(cache.visible().count(pid), 1u);
}

TEST(query_visible_range_follows_filtered_order) {
  FakeClock clock; ScriptedSource src;
  src.add(1, ScriptedProc{.name = "chrome", .rate = 1.0});
  src.add(2, ScriptedProc{.name = "explorer", .rate = 1.0});
  src.add(3, ScriptedProc{.name = "chromium", .rate = 1.0});
  ProcessOptions opts; opts.visible_buffer = 0;
  ProcessCache cache(src, clock, opts);
  ProcessQuery q(cache);
  (void)q.query(SortKey::Pid, false, VisibleRange{0, 2}, "chr");
  ASSERT_EQ(cache.visible().size(), 2u);
  ASSERT_EQ(cache.visible().count(2), 0u);
}
