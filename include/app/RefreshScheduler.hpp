#pragma once
#include <chrono>
#include "util/Clock.hpp"

namespace tasktop::app {

enum class RefreshKind { None, Partial, Full };

// Timing state for the two refresh tiers. Owned by the process cache;
// every decision takes 'now' explicitly so tests can drive it with a
// manual clock.
struct RefreshScheduler {
  using time_point = tasktop::util::IClock::time_point;

  double full_interval_s{3.0};
  double partial_interval_s{1.0};
  time_point last_full{};
  time_point last_partial{};
  bool has_run{false};

  [[nodiscard]] RefreshKind due(time_point now) const;
  void mark_full(time_point now);
  void mark_partial(time_point now);
};

} // namespace tasktop::app
