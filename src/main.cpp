#include "app/ProcessCache.hpp"
#include "app/ProcessControl.hpp"
#include "app/ProcessQuery.hpp"
#include "app/SystemStats.hpp"
#include "collectors/ProcessCollector.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Clock.hpp"

#include <unistd.h>
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace tasktop::ui;
using tasktop::app::KillReport;
using tasktop::app::KillStatus;
using tasktop::app::ProcessControl;
using tasktop::model::ProcessRecord;

namespace {

// A kill runs on its own thread so the frame loop keeps drawing and still
// sees Ctrl+C; destroying the task requests stop and joins.
struct KillTask {
  int32_t pid{};
  std::string name;
  std::mutex mu;
  std::optional<KillReport> result;
  std::jthread worker;

  [[nodiscard]] std::optional<KillReport> take() {
    std::lock_guard<std::mutex> lk(mu);
    auto r = std::move(result);
    result.reset();
    return r;
  }
};

void print_usage() {
  std::cout << "Usage: tasktop [--config PATH] [--once] [-h|--help]\n"
            << "  --config PATH  read settings from PATH instead of ~/.config/tasktop/config.toml\n"
            << "  --once         print the process table once and exit\n"
            << "Keys: arrows/PgUp/PgDn/Home/End move, c/m/p/n sort (again to reverse),\n"
            << "      / or r search, t threads, e exe path, k kill, q quit\n";
}

Dialog threads_dialog(const ProcessRecord& p, const ProcessControl& ctl, int max_lines) {
  Dialog d{.title = "Threads", .lines = {}};
  auto res = ctl.get_threads(p.pid);
  if (!res.ok()) {
    d.lines.push_back("Error: " + res.message);
    return d;
  }
  if (res.value.empty()) {
    d.lines.push_back("No threads found");
    return d;
  }
  d.lines.push_back("Process: " + p.name + " (PID: " + std::to_string(p.pid) + ")");
  d.lines.push_back(std::to_string(res.value.size()) + " thread(s)");
  d.lines.push_back(std::string());
  const size_t room = static_cast<size_t>(std::max(1, max_lines - 3));
  for (size_t i = 0; i < res.value.size(); ++i) {
    if (i + 1 == room && res.value.size() > room) {
      d.lines.push_back("... " + std::to_string(res.value.size() - i) + " more");
      break;
    }
    const auto& t = res.value[i];
    d.lines.push_back("TID " + std::to_string(t.tid) + "  user " + format_fixed(t.user_s, 2) +
                      "s  system " + format_fixed(t.system_s, 2) + "s");
  }
  return d;
}

Dialog exe_dialog(const ProcessRecord& p, const ProcessControl& ctl) {
  Dialog d{.title = "Executable Path", .lines = {}};
  auto res = ctl.get_exe_path(p.pid);
  if (!res.ok()) {
    d.lines.push_back("Error: " + res.message);
  } else if (res.value.empty()) {
    d.lines.push_back("Executable path not available");
  } else {
    d.lines = {"Process: " + p.name, "PID: " + std::to_string(p.pid), "", "Executable path:", res.value};
  }
  return d;
}

Dialog kill_result_dialog(const KillTask& task, const KillReport& rep) {
  Dialog d{.title = "Result", .lines = {}};
  const std::string who = task.name + " (PID " + std::to_string(task.pid) + ")";
  switch (rep.status) {
    case KillStatus::Ok:
      d.lines.push_back("Terminated " + who);
      break;
    case KillStatus::TimedOutThenKilled:
      d.lines.push_back(who + " ignored SIGTERM and was force-killed");
      break;
    default:
      d.lines.push_back("Failed to kill " + who + ":");
      d.lines.push_back(std::string());
      d.lines.push_back(rep.message.empty() ? std::string(tasktop::app::to_string(rep.status)) : rep.message);
      break;
  }
  if (rep.terminated.size() + rep.force_killed.size() > 1) {
    d.lines.push_back(std::to_string(rep.terminated.size()) + " terminated, " +
                      std::to_string(rep.force_killed.size()) + " force-killed");
  }
  if (!rep.failed.empty()) {
    std::string pids = "Still running:";
    for (int32_t f : rep.failed) pids += " " + std::to_string(f);
    d.lines.push_back(pids);
  }
  return d;
}

int run_once(const Config& cfg) {
  tasktop::util::SteadyClock clock;
  tasktop::collectors::ProcessCollector source(clock);
  tasktop::app::ProcessCache cache(source, clock, cfg.to_process_options());
  tasktop::app::ProcessQuery query(cache);
  auto rows = query.query(tasktop::model::SortKey::Cpu, true, std::nullopt, std::string());
  const int width = tty_stdout() ? term_cols() : 100;
  std::cout << render_once(rows, width);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  bool once = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--once") once = true;
    else if (a == "--config" && i + 1 < argc) set_config_path(argv[++i]);
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "tasktop: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }
  const Config& cfg = config();
  if (once) return run_once(cfg);

  if (!tty_stdout()) {
    std::fprintf(stderr, "tasktop: stdout is not a terminal; run it in a terminal or use --once\n");
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  auto opts = cfg.to_process_options();
  // Verbose lines would tear the screen; keep them only when stderr goes elsewhere
  opts.verbose = cfg.log.verbose && !tty_stderr();

  tasktop::util::SteadyClock clock;
  tasktop::collectors::ProcessCollector source(clock);
  tasktop::app::ProcessCache cache(source, clock, opts);
  tasktop::app::ProcessQuery query(cache);
  tasktop::app::SystemStatsSampler sys;
  ProcessControl control(std::chrono::milliseconds(cfg.process.kill_timeout_ms));

  RawTermGuard raw{}; CursorGuard curs{}; AltScreenGuard alt{cfg.ui.alt_screen};
  std::atexit(&on_atexit_restore);
  best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

  UIState st;
  tasktop::model::SystemStats stats;
  std::vector<ProcessRecord> rows;
  std::optional<Dialog> dialog;
  std::optional<ProcessRecord> target; // row the pending confirmation refers to
  std::unique_ptr<KillTask> kill_task;
  const size_t max_search = static_cast<size_t>(cfg.ui.max_search_len);

  while (!g_stop.load()) {
    if (has_input_available(cfg.refresh.frame_ms)) {
      for (const auto& ev : read_keys()) {
        if (kill_task) {
          // Only quitting is possible while a kill is in flight
          if (ev.key == Key::Char && (ev.ch == 'q' || ev.ch == 'Q')) g_stop.store(true);
          continue;
        }
        const ProcessRecord* sel = (st.selected < rows.size()) ? &rows[st.selected] : nullptr;
        switch (handle_key(st, ev, max_search)) {
          case Action::Quit:
            g_stop.store(true);
            break;
          case Action::ShowThreads:
            if (sel) { dialog = threads_dialog(*sel, control, term_rows() - 8); st.mode = Mode::Message; }
            break;
          case Action::ShowExe:
            if (sel) { dialog = exe_dialog(*sel, control); st.mode = Mode::Message; }
            break;
          case Action::RequestKill:
            if (sel) {
              target = *sel;
              dialog = Dialog{.title = "Confirm Kill",
                              .lines = {"Kill process: " + sel->name + "?", "PID: " + std::to_string(sel->pid)},
                              .hint = "press y to confirm, any other key to cancel"};
            } else {
              st.mode = Mode::Browse;
            }
            break;
          case Action::ConfirmKill:
            if (target) {
              kill_task = std::make_unique<KillTask>();
              kill_task->pid = target->pid;
              kill_task->name = target->name;
              KillTask* task = kill_task.get();
              kill_task->worker = std::jthread([task, &control](std::stop_token stop){
                KillReport rep = control.kill(task->pid, true, stop);
                std::lock_guard<std::mutex> lk(task->mu);
                task->result = std::move(rep);
              });
              dialog = Dialog{.title = "Killing",
                              .lines = {"Sending SIGTERM to " + target->name + " (PID " + std::to_string(target->pid) + ")"},
                              .hint = "waiting for it to exit, q aborts"};
              st.mode = Mode::Message;
            }
            target.reset();
            break;
          case Action::Dismiss:
            dialog.reset();
            target.reset();
            break;
          case Action::None:
            break;
        }
        if (g_stop.load()) break;
      }
    }
    if (g_stop.load()) break;

    if (kill_task) {
      if (auto rep = kill_task->take()) {
        dialog = kill_result_dialog(*kill_task, *rep);
        st.mode = Mode::Message;
        kill_task.reset();
        query.force_refresh();
      }
    }

    rows = query.query(st.sort, st.reverse, st.visible(), st.search);
    if (query.last_refresh() != tasktop::app::RefreshKind::None) {
      if (!sys.sample(cache.size(), stats) && cfg.log.verbose && !tty_stderr())
        std::fprintf(stderr, "tasktop: cannot read /proc/stat or /proc/meminfo\n");
    }
    stats.process_count = cache.size();
    render_screen(stats, rows, st, dialog);
  }
  // Stops and joins a kill still in flight
  kill_task.reset();
  return 0;
}
