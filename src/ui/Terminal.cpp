#include "ui/Terminal.hpp"
#include "ui/Config.hpp"
#include "util/AsciiLower.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tasktop::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n <= 0) return;
    buf += n; len -= static_cast<size_t>(n);
  }
}

void restore_terminal_minimal() {
  // Leave the alt screen first, then show the cursor and reset SGR
  static constexpr char alt_off[] = "\x1B[?1049l";
  static constexpr char show_cur[] = "\x1B[?25h";
  static constexpr char reset[] = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, sizeof(alt_off) - 1);
  best_effort_write(STDOUT_FILENO, show_cur, sizeof(show_cur) - 1);
  best_effort_write(STDOUT_FILENO, reset, sizeof(reset) - 1);
}

// The main loop restores the terminal through its guards on the way out
void on_signal(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

bool tty_stdout() { return ::isatty(STDOUT_FILENO) == 1; }
bool tty_stderr() { return ::isatty(STDERR_FILENO) == 1; }

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = tasktop::util::ascii_lower_copy(lc);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  if (const char* env = std::getenv("COLUMNS"); env && *env) {
    int c = std::atoi(env); if (c > 0) return std::max(20, c);
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  if (const char* env = std::getenv("LINES"); env && *env) {
    int r = std::atoi(env); if (r > 0) return r;
  }
  return 24;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() {
  if (!tty_stdout()) return {};
  return std::string("\x1B[0m");
}

std::string sgr_code_int(int code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + std::to_string(code) + "m";
}

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  if (idx < 0) idx = 0;
  if (idx <= 7) return sgr_code_int(30 + idx);
  if (idx <= 15) return sgr_code_int(90 + (idx - 8));
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

std::string cpu_color(double pct) {
  const auto& c = config();
  if (pct >= c.thresholds.cpu_warning_pct) return c.colors.warning;
  if (pct >= c.thresholds.cpu_caution_pct) return c.colors.caution;
  return c.colors.normal;
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

} // namespace tasktop::ui
