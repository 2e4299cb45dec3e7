#pragma once
#include "model/Process.hpp"

namespace tasktop::app {

// Rising if new - old >= threshold, Falling if old - new >= threshold,
// Stable otherwise. The boundary itself counts as a change.
[[nodiscard]] tasktop::model::Trend compute_trend(double old_value, double new_value, double threshold) noexcept;

[[nodiscard]] const char* trend_arrow(tasktop::model::Trend t, bool unicode);

} // namespace tasktop::app
