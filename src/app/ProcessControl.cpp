#include "app/ProcessControl.hpp"
#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace tasktop::app {

using tasktop::collectors::ProcessCollector;
using tasktop::model::ProcStatus;
using tasktop::model::ThreadRecord;

static constexpr auto kPollInterval = std::chrono::milliseconds(50);
static constexpr auto kReapWait = std::chrono::milliseconds(1000);

const char* to_string(KillStatus s) {
  switch (s) {
    case KillStatus::Ok: return "terminated";
    case KillStatus::NotFound: return "process no longer exists";
    case KillStatus::AccessDenied: return "access denied";
    case KillStatus::TimedOutThenKilled: return "force-killed after timeout";
    case KillStatus::Other: return "error";
  }
  return "error";
}

static std::string pid_dir(int32_t pid) { return "/proc/" + std::to_string(pid); }

ProcessControl::ProcessControl(std::chrono::milliseconds kill_timeout) : kill_timeout_(kill_timeout) {}

OpResult<std::vector<ThreadRecord>> ProcessControl::get_threads(int32_t pid) const {
  OpResult<std::vector<ThreadRecord>> res;
  std::vector<std::string> tids;
  res.status = tasktop::util::list_dir_status(pid_dir(pid) + "/task", tids);
  if (res.status != ProcStatus::Ok) {
    res.message = tasktop::model::to_string(res.status);
    return res;
  }
  long hz = ::sysconf(_SC_CLK_TCK);
  const double ticks = hz > 0 ? static_cast<double>(hz) : 100.0;
  for (const auto& t : tids) {
    if (!tasktop::util::is_numeric(t)) continue;
    std::string content;
    // Threads exit while we walk the directory; skip those
    if (tasktop::util::read_file_status(pid_dir(pid) + "/task/" + t + "/stat", content) != ProcStatus::Ok) continue;
    ProcessCollector::StatFields f;
    if (!ProcessCollector::parse_stat_line(content, f)) continue;
    res.value.push_back(ThreadRecord{
        .tid = static_cast<int32_t>(std::strtol(t.c_str(), nullptr, 10)),
        .user_s = static_cast<double>(f.utime) / ticks,
        .system_s = static_cast<double>(f.stime) / ticks});
  }
  std::sort(res.value.begin(), res.value.end(),
            [](const ThreadRecord& a, const ThreadRecord& b){ return a.tid < b.tid; });
  return res;
}

OpResult<std::string> ProcessControl::get_exe_path(int32_t pid) const {
  OpResult<std::string> res;
  std::string err;
  res.status = tasktop::util::read_symlink_status(pid_dir(pid) + "/exe", res.value, &err);
  if (res.status == ProcStatus::NotFound) {
    // Kernel threads have no exe link but the process is there
    std::string stat;
    if (tasktop::util::read_file_status(pid_dir(pid) + "/stat", stat) == ProcStatus::Ok) {
      res.status = ProcStatus::Ok;
      res.value.clear();
      return res;
    }
  }
  if (res.status != ProcStatus::Ok) {
    res.message = (res.status == ProcStatus::Other && !err.empty()) ? err : tasktop::model::to_string(res.status);
  }
  return res;
}

std::vector<int32_t> ProcessControl::descendants(int32_t pid) {
  // One /proc scan builds the whole parent -> children map
  std::unordered_map<int32_t, std::vector<int32_t>> children;
  for (int32_t p : tasktop::util::list_pids()) {
    std::string content;
    if (tasktop::util::read_file_status(pid_dir(p) + "/stat", content) != ProcStatus::Ok) continue;
    ProcessCollector::StatFields f;
    if (!ProcessCollector::parse_stat_line(content, f)) continue;
    children[f.ppid].push_back(p);
  }
  std::vector<int32_t> out;
  std::unordered_set<int32_t> seen{pid};
  std::deque<int32_t> todo{pid};
  while (!todo.empty()) {
    int32_t cur = todo.front(); todo.pop_front();
    auto it = children.find(cur);
    if (it == children.end()) continue;
    for (int32_t c : it->second) {
      if (!seen.insert(c).second) continue;
      out.push_back(c);
      todo.push_back(c);
    }
  }
  return out;
}

bool ProcessControl::is_alive(int32_t pid) {
  // Reap our own children so they don't linger as zombies
  int wstatus = 0;
  if (::waitpid(static_cast<pid_t>(pid), &wstatus, WNOHANG) == pid) return false;
  if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) return false;
  std::string content;
  if (tasktop::util::read_file_status(pid_dir(pid) + "/stat", content) != ProcStatus::Ok) return true;
  ProcessCollector::StatFields f;
  if (!ProcessCollector::parse_stat_line(content, f)) return true;
  return f.state != 'Z' && f.state != 'X' && f.state != 'x';
}

KillReport ProcessControl::kill(int32_t pid, bool include_children, std::stop_token st) const {
  KillReport rep;
  if (pid <= 0) {
    rep.status = KillStatus::Other;
    rep.message = "invalid pid " + std::to_string(pid);
    return rep;
  }
  if (!is_alive(pid)) {
    rep.status = KillStatus::NotFound;
    rep.message = to_string(rep.status);
    return rep;
  }

  // Children first, collected before anything is signalled
  std::vector<int32_t> targets;
  if (include_children) targets = descendants(pid);
  targets.push_back(pid);

  bool denied = false;
  std::vector<int32_t> pending;
  for (int32_t t : targets) {
    if (::kill(static_cast<pid_t>(t), SIGTERM) == 0) { pending.push_back(t); continue; }
    const int err = errno;
    if (err == ESRCH) {
      if (t == pid) {
        rep.status = KillStatus::NotFound;
        rep.message = to_string(rep.status);
        return rep;
      }
      rep.terminated.push_back(t); // exited on its own
      continue;
    }
    if (err == EPERM) denied = true;
    rep.failed.push_back(t);
  }
  if (std::find(rep.failed.begin(), rep.failed.end(), pid) != rep.failed.end() && pending.empty()) {
    rep.status = denied ? KillStatus::AccessDenied : KillStatus::Other;
    rep.message = denied ? std::string(to_string(rep.status)) : std::string("SIGTERM failed for ") + std::to_string(pid);
    return rep;
  }

  const auto deadline = std::chrono::steady_clock::now() + kill_timeout_;
  for (;;) {
    std::erase_if(pending, [&](int32_t t){
      if (is_alive(t)) return false;
      rep.terminated.push_back(t);
      return true;
    });
    if (pending.empty()) break;
    if (st.stop_requested()) {
      rep.failed.insert(rep.failed.end(), pending.begin(), pending.end());
      rep.status = KillStatus::Other;
      rep.message = "aborted while waiting for " + std::to_string(pending.size()) + " process(es)";
      return rep;
    }
    if (std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(kPollInterval);
  }

  for (int32_t t : pending) {
    if (::kill(static_cast<pid_t>(t), SIGKILL) == 0) { rep.force_killed.push_back(t); continue; }
    const int err = errno;
    if (err == ESRCH) { rep.terminated.push_back(t); continue; }
    if (err == EPERM) denied = true;
    rep.failed.push_back(t);
  }

  // SIGKILL is asynchronous; give the kernel a moment before reporting
  if (!rep.force_killed.empty()) {
    const auto reap_deadline = std::chrono::steady_clock::now() + kReapWait;
    std::vector<int32_t> dying = rep.force_killed;
    while (!dying.empty() && std::chrono::steady_clock::now() < reap_deadline) {
      std::erase_if(dying, [](int32_t t){ return !is_alive(t); });
      if (!dying.empty()) std::this_thread::sleep_for(kPollInterval);
    }
    for (int32_t t : dying) {
      std::erase(rep.force_killed, t);
      rep.failed.push_back(t);
    }
  }

  if (!rep.failed.empty()) {
    rep.status = denied ? KillStatus::AccessDenied : KillStatus::Other;
    rep.message = std::to_string(rep.failed.size()) + " of " + std::to_string(targets.size()) +
                  " process(es) could not be killed";
  } else if (!rep.force_killed.empty()) {
    rep.status = KillStatus::TimedOutThenKilled;
    rep.message = std::to_string(rep.force_killed.size()) + " process(es) force-killed after " +
                  std::to_string(kill_timeout_.count()) + "ms";
  } else {
    rep.status = KillStatus::Ok;
  }
  return rep;
}

} // namespace tasktop::app
