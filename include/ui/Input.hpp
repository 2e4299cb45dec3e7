#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace tasktop::ui {

enum class Key { None, Char, Up, Down, PageUp, PageDown, Home, End, Enter, Escape, Backspace };

struct KeyEvent {
  Key key{Key::None};
  char ch{0}; // set for Key::Char
};

// Split raw terminal bytes into key events. A lone ESC at the end of the
// buffer is the Escape key.
std::vector<KeyEvent> decode_keys(const unsigned char* buf, size_t n);

// Wait up to timeout_ms for stdin to become readable.
bool has_input_available(int timeout_ms);

// Non-blocking read of whatever is pending on stdin.
std::vector<KeyEvent> read_keys();

enum class Mode { Browse, Search, ConfirmKill, Message };

enum class Action { None, Quit, ShowThreads, ShowExe, RequestKill, ConfirmKill, Dismiss };

struct UIState {
  tasktop::model::SortKey sort{tasktop::model::SortKey::Cpu};
  bool reverse{true};
  size_t selected{0};
  size_t scroll{0};
  size_t page_rows{20}; // table rows on screen, set by the renderer
  size_t total{0};      // rows in the last query result
  std::string search;
  Mode mode{Mode::Browse};

  // Rows the table shows, as a range into the last query result
  [[nodiscard]] tasktop::model::VisibleRange visible() const;
  // Keep selection and scroll inside [0, total) and the selection on screen
  void clamp();
};

// Apply one key to the state; returns what the caller has to do about it.
Action handle_key(UIState& st, const KeyEvent& ev, size_t max_search_len);

} // namespace tasktop::ui
