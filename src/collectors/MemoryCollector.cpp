#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace tasktop::collectors {

namespace {

struct MeminfoField {
  std::string_view key;
  uint64_t* dst;
};

// "MemTotal:       2097152 kB" -> 2097152
uint64_t value_kb(std::string_view rest) {
  while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
  uint64_t v = 0;
  std::from_chars(rest.data(), rest.data() + rest.size(), v);
  return v;
}

} // namespace

bool MemoryCollector::sample(tasktop::model::Memory& out) const {
  auto txt = tasktop::util::read_file_string("/proc/meminfo");
  if (!txt) return false;

  uint64_t total = 0, avail = 0, free_kb = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  const MeminfoField fields[] = {
    {"MemTotal:", &total}, {"MemAvailable:", &avail}, {"MemFree:", &free_kb},
    {"Buffers:", &buffers}, {"Cached:", &cached},
  };

  size_t start = 0;
  while (start < txt->size()) {
    size_t nl = txt->find('\n', start);
    if (nl == std::string::npos) nl = txt->size();
    std::string_view line(txt->data() + start, nl - start);
    start = nl + 1;
    for (const auto& f : fields) {
      if (!line.starts_with(f.key)) continue;
      *f.dst = value_kb(line.substr(f.key.size()));
      if (f.dst == &avail) have_avail = true;
      break;
    }
  }
  if (total == 0) return false;

  const uint64_t reclaimable = have_avail ? avail : free_kb + buffers + cached;
  out.total_kb = total;
  out.used_kb = total > reclaimable ? total - reclaimable : 0;
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(total);
  return true;
}

} // namespace tasktop::collectors
