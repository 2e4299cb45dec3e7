#include "app/SystemStats.hpp"
#include "util/Churn.hpp"

namespace tasktop::app {

static constexpr int kChurnWindowMs = 2000;

bool SystemStatsSampler::sample(size_t process_count, tasktop::model::SystemStats& out) {
  const bool cpu_ok = cpu_.sample(out.cpu);
  const bool mem_ok = mem_.sample(out.mem);
  out.process_count = process_count;
  out.churn_recent = tasktop::util::count_recent_ms(kChurnWindowMs);
  return cpu_ok || mem_ok;
}

} // namespace tasktop::app
