#include "app/Trend.hpp"

namespace tasktop::app {

using tasktop::model::Trend;

Trend compute_trend(double old_value, double new_value, double threshold) noexcept {
  if (new_value - old_value >= threshold) return Trend::Rising;
  if (old_value - new_value >= threshold) return Trend::Falling;
  return Trend::Stable;
}

const char* trend_arrow(Trend t, bool unicode) {
  switch (t) {
    case Trend::Rising:  return unicode ? "▲" : "^";
    case Trend::Falling: return unicode ? "▼" : "v";
    case Trend::Stable:  return " ";
  }
  return " ";
}

} // namespace tasktop::app
