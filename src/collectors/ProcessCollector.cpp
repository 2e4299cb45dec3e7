#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include <cctype>
#include <sstream>
#include <unistd.h>

namespace tasktop::collectors {

using tasktop::model::ProcStatus;

unsigned read_cpu_count() {
  auto txt = tasktop::util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  if (count == 0) count = 1;
  return count;
}

ProcessCollector::ProcessCollector(tasktop::util::IClock& clock) : clock_(clock) {
  ncpu_ = read_cpu_count();
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) ticks_per_sec_ = hz;
  long page = ::sysconf(_SC_PAGESIZE);
  if (page > 0) page_kb_ = page / 1024;
}

bool ProcessCollector::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return false;
  if (rp + 2 > content.size()) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  ss >> out.state >> out.ppid;
  // pgrp .. cmajflt
  for (int i = 0; i < 9; i++) { std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // cutime, cstime, priority, nice, num_threads, itrealvalue
  for (int i = 0; i < 6; i++) { std::string tmp; ss >> tmp; }
  ss >> out.start_ticks;
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes;
  ss >> out.rss_pages;
  return !ss.fail();
}

const char* ProcessCollector::status_label(char state) {
  switch (state) {
    case 'R': return "running";
    case 'S': return "sleeping";
    case 'D': return "disk-sleep";
    case 'T': return "stopped";
    case 't': return "tracing-stop";
    case 'Z': return "zombie";
    case 'X': case 'x': return "dead";
    case 'I': return "idle";
    case 'P': return "parked";
    case 'W': return "waking";
    case 'K': return "wake-kill";
    default:  return "unknown";
  }
}

// The kernel truncates comm to 15 chars; prefer argv[0]'s basename when it
// extends comm.
std::string ProcessCollector::long_name(int32_t pid, const std::string& comm) {
  if (comm.size() < 15) return comm;
  std::string cmdline;
  if (tasktop::util::read_file_status("/proc/" + std::to_string(pid) + "/cmdline", cmdline) != ProcStatus::Ok)
    return comm;
  auto nul = cmdline.find('\0');
  std::string argv0 = cmdline.substr(0, nul);
  auto slash = argv0.rfind('/');
  std::string base = (slash == std::string::npos) ? argv0 : argv0.substr(slash + 1);
  if (base.size() > comm.size() && base.rfind(comm, 0) == 0) return base;
  return comm;
}

std::vector<int32_t> ProcessCollector::list_live_pids() {
  return tasktop::util::list_pids();
}

ProcStatus ProcessCollector::sample(int32_t pid, SampleScope scope, tasktop::model::RawSample& out) {
  std::string content;
  auto st = tasktop::util::read_file_status("/proc/" + std::to_string(pid) + "/stat", content);
  if (st != ProcStatus::Ok) return st;
  StatFields f;
  if (!parse_stat_line(content, f)) return ProcStatus::Other;

  const auto now = clock_.now();
  const uint64_t total = f.utime + f.stime;
  double cpu_pct = 0.0;
  auto it = last_per_proc_.find(pid);
  if (it != last_per_proc_.end() && it->second.start_ticks == f.start_ticks) {
    double elapsed = tasktop::util::seconds_between(it->second.at, now);
    uint64_t dp = (total > it->second.total_ticks) ? (total - it->second.total_ticks) : 0;
    if (elapsed > 0.0) {
      cpu_pct = 100.0 * (static_cast<double>(dp) / static_cast<double>(ticks_per_sec_)) / elapsed;
    }
  }
  // A different start time means the pid was reused: the old baseline is meaningless
  last_per_proc_[pid] = Baseline{total, f.start_ticks, now};

  out.pid = pid;
  out.ppid = f.ppid;
  out.cpu_pct_raw = cpu_pct;
  out.start_ticks = f.start_ticks;
  if (scope == SampleScope::Full) {
    out.name = long_name(pid, f.comm);
    out.status = status_label(f.state);
    out.rss_bytes = (f.rss_pages > 0) ? static_cast<uint64_t>(f.rss_pages) * static_cast<uint64_t>(page_kb_) * 1024ull : 0;
  }
  return ProcStatus::Ok;
}

} // namespace tasktop::collectors
