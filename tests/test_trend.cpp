#include "minitest.hpp"
#include "app/Trend.hpp"
#include "app/RefreshScheduler.hpp"

using tasktop::app::compute_trend;
using tasktop::app::RefreshKind;
using tasktop::app::RefreshScheduler;
using tasktop::model::Trend;

TEST(trend_boundary_counts_as_change) {
  ASSERT_TRUE(compute_trend(10.0, 20.0, 10.0) == Trend::Rising);
  ASSERT_TRUE(compute_trend(20.0, 10.0, 10.0) == Trend::Falling);
  ASSERT_TRUE(compute_trend(10.0, 19.9, 10.0) == Trend::Stable);
  ASSERT_TRUE(compute_trend(19.9, 10.0, 10.0) == Trend::Stable);
  ASSERT_TRUE(compute_trend(500.0, 449.0, 50.0) == Trend::Falling);
}

TEST(trend_zero_threshold_flags_any_change) {
  ASSERT_TRUE(compute_trend(1.0, 1.0, 0.0) == Trend::Rising);
  ASSERT_TRUE(compute_trend(1.0, 1.5, 0.0) == Trend::Rising);
  ASSERT_TRUE(compute_trend(1.5, 1.0, 0.0) == Trend::Falling);
}

TEST(trend_arrows) {
  ASSERT_EQ(std::string(tasktop::app::trend_arrow(Trend::Rising, false)), std::string("^"));
  ASSERT_EQ(std::string(tasktop::app::trend_arrow(Trend::Falling, false)), std::string("v"));
  ASSERT_EQ(std::string(tasktop::app::trend_arrow(Trend::Stable, true)), std::string(" "));
  ASSERT_EQ(std::string(tasktop::app::trend_arrow(Trend::Rising, true)), std::string("▲"));
}

TEST(scheduler_first_tick_is_full) {
  RefreshScheduler s;
  RefreshScheduler::time_point t0{};
  ASSERT_TRUE(s.due(t0) == RefreshKind::Full);
  s.mark_full(t0);
  ASSERT_TRUE(s.due(t0) == RefreshKind::None);
}

TEST(scheduler_partial_then_full) {
  using namespace std::chrono;
  RefreshScheduler s;
  RefreshScheduler::time_point t0{};
  s.mark_full(t0);
  ASSERT_TRUE(s.due(t0 + milliseconds(999)) == RefreshKind::None);
  ASSERT_TRUE(s.due(t0 + milliseconds(1000)) == RefreshKind::Partial);
  s.mark_partial(t0 + milliseconds(1000));
  ASSERT_TRUE(s.due(t0 + milliseconds(1500)) == RefreshKind::None);
  // Full wins when both are due
  ASSERT_TRUE(s.due(t0 + milliseconds(3000)) == RefreshKind::Full);
  s.mark_full(t0 + milliseconds(3000));
  ASSERT_TRUE(s.due(t0 + milliseconds(3500)) == RefreshKind::None);
}

TEST(scheduler_first_check_is_full) {
  RefreshScheduler s;
  RefreshScheduler::time_point t0{};
  ASSERT_TRUE(s.due(t0) == RefreshKind::Full);
  s.mark_full(t0);
  ASSERT_TRUE(s.due(t0) == RefreshKind::None);
}

TEST(scheduler_custom_intervals) {
  using namespace std::chrono;
  RefreshScheduler s;
  s.full_interval_s = 0.5;
  s.partial_interval_s = 0.2;
  RefreshScheduler::time_point t0{};
  s.mark_full(t0);
  ASSERT_TRUE(s.due(t0 + milliseconds(200)) == RefreshKind::Partial);
  ASSERT_TRUE(s.due(t0 + milliseconds(500)) == RefreshKind::Full);
}
