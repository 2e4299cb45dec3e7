#pragma once

#include <atomic>
#include <string>
#include <termios.h>

namespace tasktop::ui {

// Set by SIGINT/SIGTERM; the main loop and a pending kill wait poll it.
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_signal(int);
void on_atexit_restore();

[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool tty_stderr();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// Escape sequences; all empty when stdout is not a terminal
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_code_int(int code);
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// normal/caution/warning role color for a CPU percentage
[[nodiscard]] std::string cpu_color(double pct);

// Async-signal-safe
void best_effort_write(int fd, const char* buf, size_t len);

class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

} // namespace tasktop::ui
