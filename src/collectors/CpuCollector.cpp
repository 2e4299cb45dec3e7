#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

namespace tasktop::collectors {

// user nice system idle iowait irq softirq steal; guest time is already
// folded into user/nice by the kernel.
static bool parse_aggregate(std::string_view line, tasktop::model::CpuTimes& out) {
  uint64_t f[8]{};
  size_t n = 0;
  const char* p = line.data() + 3;
  const char* end = line.data() + line.size();
  while (n < 8 && p < end) {
    while (p < end && *p == ' ') ++p;
    auto [next, ec] = std::from_chars(p, end, f[n]);
    if (ec != std::errc()) break;
    p = next;
    ++n;
  }
  if (n < 4) return false;
  out.idle = f[3] + f[4];
  out.busy = f[0] + f[1] + f[2] + f[5] + f[6] + f[7];
  return true;
}

bool CpuCollector::sample(tasktop::model::CpuSnapshot& out) {
  auto txt = tasktop::util::read_file_string("/proc/stat");
  if (!txt) return false;

  tasktop::model::CpuTimes now{};
  bool have_aggregate = false;
  int cores = 0;
  size_t start = 0;
  while (start < txt->size()) {
    size_t nl = txt->find('\n', start);
    if (nl == std::string::npos) nl = txt->size();
    std::string_view line(txt->data() + start, nl - start);
    start = nl + 1;
    if (!line.starts_with("cpu")) {
      if (have_aggregate) break; // cpu lines come first
      continue;
    }
    if (line.size() > 3 && std::isdigit(static_cast<unsigned char>(line[3]))) ++cores;
    else have_aggregate = parse_aggregate(line, now);
  }
  if (!have_aggregate) return false;

  double pct = 0.0;
  if (primed_ && now.total() > last_.total()) {
    const uint64_t dt = now.total() - last_.total();
    const uint64_t db = now.busy > last_.busy ? now.busy - last_.busy : 0;
    pct = 100.0 * static_cast<double>(db) / static_cast<double>(dt);
  }
  last_ = now;
  primed_ = true;

  out.times = now;
  out.usage_pct = pct > 100.0 ? 100.0 : pct;
  out.logical_threads = cores > 0 ? cores : 1;
  return true;
}

} // namespace tasktop::collectors
