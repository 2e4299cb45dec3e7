#include "minitest.hpp"
#include "app/ProcessCache.hpp"
#include "app/ProcessControl.hpp"
#include "collectors/ProcessCollector.hpp"
#include "util/Clock.hpp"

#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <thread>

namespace fs = std::filesystem;
using tasktop::app::KillStatus;
using tasktop::app::ProcessControl;
using tasktop::model::ProcStatus;

namespace {

// Child that blocks until signalled. With ignore_term it survives SIGTERM.
// Returns once the child has set up its signal disposition.
pid_t spawn_sleeper(bool ignore_term) {
  int fds[2];
  if (::pipe(fds) != 0) return -1;
  pid_t pid = ::fork();
  if (pid == 0) {
    ::close(fds[0]);
    if (ignore_term) ::signal(SIGTERM, SIG_IGN);
    char ok = 1;
    (void)!::write(fds[1], &ok, 1);
    ::close(fds[1]);
    for (;;) ::pause();
  }
  ::close(fds[1]);
  char ok = 0;
  (void)!::read(fds[0], &ok, 1);
  ::close(fds[0]);
  return pid;
}

// Child that forks a grandchild, reports the grandchild's pid, then blocks.
pid_t spawn_parent_with_child(pid_t& grandchild) {
  int fds[2];
  grandchild = -1;
  if (::pipe(fds) != 0) return -1;
  pid_t pid = ::fork();
  if (pid == 0) {
    ::close(fds[0]);
    pid_t gc = ::fork();
    if (gc == 0) {
      ::close(fds[1]);
      for (;;) ::pause();
    }
    (void)!::write(fds[1], &gc, sizeof(gc));
    ::close(fds[1]);
    for (;;) ::pause();
  }
  ::close(fds[1]);
  (void)!::read(fds[0], &grandchild, sizeof(grandchild));
  ::close(fds[0]);
  return pid;
}

// Reap pid if it is ours and wait for its /proc entry to disappear.
bool gone_within(pid_t pid, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    int ws = 0;
    (void)::waitpid(pid, &ws, WNOHANG);
    if (!fs::exists("/proc/" + std::to_string(pid))) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

void force_cleanup(pid_t pid) {
  if (pid <= 0) return;
  ::kill(pid, SIGKILL);
  int ws = 0;
  (void)::waitpid(pid, &ws, 0);
}

} // namespace

TEST(kill_terminates_child) {
  unsetenv("TASKTOP_PROC_ROOT");
  pid_t pid = spawn_sleeper(false);
  ASSERT_TRUE(pid > 0);
  ASSERT_TRUE(ProcessControl::is_alive(pid));
  ProcessControl ctl;
  auto rep = ctl.kill(pid);
  ASSERT_TRUE(rep.status == KillStatus::Ok);
  ASSERT_TRUE(rep.ok());
  ASSERT_TRUE(std::find(rep.terminated.begin(), rep.terminated.end(), pid) != rep.terminated.end());
  ASSERT_TRUE(rep.failed.empty());
  ASSERT_FALSE(ProcessControl::is_alive(pid));
}

TEST(kill_takes_descendants_and_cache_drops_them) {
  unsetenv("TASKTOP_PROC_ROOT");
  // Orphaned grandchildren get reparented to us so they can be reaped
  ::prctl(PR_SET_CHILD_SUBREAPER, 1);
  pid_t gc = -1;
  pid_t pid = spawn_parent_with_child(gc);
  ASSERT_TRUE(pid > 0);
  ASSERT_TRUE(gc > 0);

  auto kids = ProcessControl::descendants(pid);
  ASSERT_TRUE(std::find(kids.begin(), kids.end(), gc) != kids.end());

  tasktop::util::SteadyClock clock;
  tasktop::collectors::ProcessCollector source(clock);
  tasktop::app::ProcessCache cache(source, clock);
  cache.refresh_full();
  ASSERT_TRUE(cache.find(pid) != nullptr);
  ASSERT_TRUE(cache.find(gc) != nullptr);

  ProcessControl ctl;
  auto rep = ctl.kill(pid, true);
  ASSERT_TRUE(rep.ok());
  ASSERT_EQ(rep.terminated.size() + rep.force_killed.size(), 2u);
  ASSERT_TRUE(gone_within(pid, std::chrono::milliseconds(2000)));
  ASSERT_TRUE(gone_within(gc, std::chrono::milliseconds(2000)));

  cache.force_refresh();
  ASSERT_TRUE(cache.find(pid) == nullptr);
  ASSERT_TRUE(cache.find(gc) == nullptr);
}

TEST(kill_escalates_when_sigterm_is_ignored) {
  unsetenv("TASKTOP_PROC_ROOT");
  pid_t pid = spawn_sleeper(true);
  ASSERT_TRUE(pid > 0);
  ProcessControl ctl(std::chrono::milliseconds(200));
  const auto t0 = std::chrono::steady_clock::now();
  auto rep = ctl.kill(pid, false);
  const auto took = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(rep.status == KillStatus::TimedOutThenKilled);
  ASSERT_TRUE(rep.ok());
  ASSERT_EQ(rep.force_killed.size(), 1u);
  ASSERT_EQ(rep.force_killed[0], pid);
  ASSERT_TRUE(took >= std::chrono::milliseconds(200));
  ASSERT_FALSE(ProcessControl::is_alive(pid));
}

TEST(kill_reaped_pid_is_not_found) {
  unsetenv("TASKTOP_PROC_ROOT");
  pid_t pid = spawn_sleeper(false);
  ASSERT_TRUE(pid > 0);
  force_cleanup(pid);
  ProcessControl ctl;
  auto rep = ctl.kill(pid);
  ASSERT_TRUE(rep.status == KillStatus::NotFound);
  ASSERT_FALSE(rep.ok());
  ASSERT_TRUE(ctl.kill(0).status == KillStatus::Other);
  ASSERT_TRUE(ctl.kill(-5).status == KillStatus::Other);
}

TEST(kill_abort_does_not_escalate) {
  unsetenv("TASKTOP_PROC_ROOT");
  pid_t pid = spawn_sleeper(true);
  ASSERT_TRUE(pid > 0);
  std::stop_source stop;
  stop.request_stop();
  ProcessControl ctl(std::chrono::milliseconds(5000));
  auto rep = ctl.kill(pid, false, stop.get_token());
  ASSERT_TRUE(rep.status == KillStatus::Other);
  ASSERT_TRUE(rep.force_killed.empty());
  ASSERT_EQ(rep.failed.size(), 1u);
  // Still running: it ignored SIGTERM and was never sent SIGKILL
  ASSERT_TRUE(ProcessControl::is_alive(pid));
  force_cleanup(pid);
}

TEST(threads_and_exe_of_self) {
  unsetenv("TASKTOP_PROC_ROOT");
  ProcessControl ctl;
  const int32_t self = static_cast<int32_t>(::getpid());
  auto th = ctl.get_threads(self);
  ASSERT_TRUE(th.ok());
  ASSERT_TRUE(!th.value.empty());
  ASSERT_TRUE(std::is_sorted(th.value.begin(), th.value.end(),
                             [](const auto& a, const auto& b){ return a.tid < b.tid; }));
  ASSERT_TRUE(std::any_of(th.value.begin(), th.value.end(), [&](const auto& t){ return t.tid == self; }));

  auto exe = ctl.get_exe_path(self);
  ASSERT_TRUE(exe.ok());
  ASSERT_EQ(exe.value, fs::read_symlink("/proc/self/exe").string());
}

TEST(operations_on_missing_pid_report_not_found) {
  unsetenv("TASKTOP_PROC_ROOT");
  pid_t pid = spawn_sleeper(false);
  force_cleanup(pid);
  ProcessControl ctl;
  auto th = ctl.get_threads(pid);
  ASSERT_TRUE(th.status == ProcStatus::NotFound);
  ASSERT_FALSE(th.message.empty());
  auto exe = ctl.get_exe_path(pid);
  ASSERT_TRUE(exe.status == ProcStatus::NotFound);
}

namespace {

struct FakeTree {
  fs::path root;
  FakeTree() {
    root = fs::temp_directory_path() / ("tasktop_test_tree_" + std::to_string(::getpid()));
    fs::remove_all(root);
    fs::create_directories(root / "proc");
    setenv("TASKTOP_PROC_ROOT", root.c_str(), 1);
  }
  ~FakeTree() {
    unsetenv("TASKTOP_PROC_ROOT");
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  void add(int32_t pid, int32_t ppid, const char* comm) {
    fs::create_directories(root / "proc" / std::to_string(pid));
    std::ofstream(root / "proc" / std::to_string(pid) / "stat")
        << pid << " (" << comm << ") S " << ppid
        << " 1 1 0 -1 0 0 0 0 0 5 5 0 0 20 0 1 0 100 0 0\n";
  }
};

} // namespace

TEST(descendants_walks_tree_breadth_first) {
  FakeTree t;
  t.add(1, 0, "init");
  t.add(10, 1, "shell");
  t.add(11, 10, "make");
  t.add(12, 10, "vim");
  t.add(13, 11, "cc1plus");
  t.add(20, 1, "other");
  auto d = ProcessControl::descendants(10);
  ASSERT_EQ(d.size(), 3u);
  ASSERT_TRUE(d.back() == 13);
  ASSERT_TRUE(std::find(d.begin(), d.end(), 20) == d.end());
  ASSERT_TRUE(ProcessControl::descendants(13).empty());
}

TEST(kernel_thread_has_empty_exe_path) {
  FakeTree t;
  t.add(2, 0, "kthreadd");
  ProcessControl ctl;
  auto exe = ctl.get_exe_path(2);
  ASSERT_TRUE(exe.ok());
  ASSERT_TRUE(exe.value.empty());
}
