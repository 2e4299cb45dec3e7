#pragma once
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace tasktop::app {

template <class T>
struct OpResult {
  tasktop::model::ProcStatus status{tasktop::model::ProcStatus::Ok};
  T value{};
  std::string message; // empty on success
  [[nodiscard]] bool ok() const { return status == tasktop::model::ProcStatus::Ok; }
};

enum class KillStatus { Ok, NotFound, AccessDenied, TimedOutThenKilled, Other };

struct KillReport {
  KillStatus status{KillStatus::Ok};
  std::vector<int32_t> terminated;   // exited within the grace period
  std::vector<int32_t> force_killed; // SIGKILL delivered after the grace period
  std::vector<int32_t> failed;       // still alive or could not be signalled
  std::string message;
  // Partial success (some pids failed) is not ok()
  [[nodiscard]] bool ok() const { return status == KillStatus::Ok || status == KillStatus::TimedOutThenKilled; }
};

[[nodiscard]] const char* to_string(KillStatus s);

// One-shot process operations for the UI. Nothing here throws; every
// failure comes back in the result.
class ProcessControl {
public:
  explicit ProcessControl(std::chrono::milliseconds kill_timeout = std::chrono::milliseconds(3000));

  [[nodiscard]] OpResult<std::vector<tasktop::model::ThreadRecord>> get_threads(int32_t pid) const;
  [[nodiscard]] OpResult<std::string> get_exe_path(int32_t pid) const;

  // SIGTERM the process (and its descendants, collected before signalling),
  // wait for all of them, SIGKILL whatever outlives the timeout. A stop
  // request ends the wait early without escalating.
  [[nodiscard]] KillReport kill(int32_t pid, bool include_children = true,
                                std::stop_token st = {}) const;

  // Recursive children of pid, breadth first.
  [[nodiscard]] static std::vector<int32_t> descendants(int32_t pid);
  // Zombies count as gone.
  [[nodiscard]] static bool is_alive(int32_t pid);

private:
  std::chrono::milliseconds kill_timeout_;
};

} // namespace tasktop::app
