#pragma once
#include <chrono>
#include <thread>

namespace tasktop::util {

// Time source for the refresh scheduler, the cache and the procfs source.
// Tests swap in a manual clock so refresh timing is deterministic.
class IClock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  using duration = std::chrono::steady_clock::duration;

  virtual ~IClock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
  virtual void sleep_for(duration d) = 0;
};

class SteadyClock : public IClock {
public:
  [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
  void sleep_for(duration d) override { std::this_thread::sleep_for(d); }
};

// Seconds as a double, for comparing against float config values.
[[nodiscard]] inline double seconds_between(IClock::time_point a, IClock::time_point b) {
  return std::chrono::duration<double>(b - a).count();
}

} // namespace tasktop::util
