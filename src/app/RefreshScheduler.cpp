#include "app/RefreshScheduler.hpp"

namespace tasktop::app {

using tasktop::util::seconds_between;

RefreshKind RefreshScheduler::due(time_point now) const {
  if (!has_run) return RefreshKind::Full;
  if (seconds_between(last_full, now) >= full_interval_s) return RefreshKind::Full;
  if (seconds_between(last_partial, now) >= partial_interval_s) return RefreshKind::Partial;
  return RefreshKind::None;
}

// A full pass re-samples everything, so it also restarts the partial timer.
void RefreshScheduler::mark_full(time_point now) {
  last_full = now;
  last_partial = now;
  has_run = true;
}

void RefreshScheduler::mark_partial(time_point now) {
  last_partial = now;
}

} // namespace tasktop::app
