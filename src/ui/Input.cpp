#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>
#include <algorithm>

namespace tasktop::ui {

using tasktop::model::SortKey;

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = std::clamp(timeout_ms, 0, 1000);
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

std::vector<KeyEvent> read_keys() {
  unsigned char buf[64];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return decode_keys(buf, static_cast<size_t>(n));
}

std::vector<KeyEvent> decode_keys(const unsigned char* buf, size_t n) {
  std::vector<KeyEvent> out;
  size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == '\r' || c == '\n') { out.push_back({Key::Enter, 0}); continue; }
    if (c == 0x7F || c == 0x08) { out.push_back({Key::Backspace, 0}); continue; }
    if (c != 0x1B) {
      if (c >= 0x20 && c < 0x7F) out.push_back({Key::Char, static_cast<char>(c)});
      continue;
    }
    // ESC sequences: CSI (ESC [) and SS3 (ESC O)
    if (k >= n || (buf[k] != '[' && buf[k] != 'O')) { out.push_back({Key::Escape, 0}); continue; }
    const unsigned char intro = buf[k++];
    if (k >= n) { out.push_back({Key::Escape, 0}); continue; }
    unsigned char b = buf[k++];
    switch (b) {
      case 'A': out.push_back({Key::Up, 0}); continue;
      case 'B': out.push_back({Key::Down, 0}); continue;
      case 'H': out.push_back({Key::Home, 0}); continue;
      case 'F': out.push_back({Key::End, 0}); continue;
      case 'C': case 'D': continue; // left/right unused
      default: break;
    }
    if (intro == '[' && b >= '1' && b <= '8' && k < n && buf[k] == '~') {
      ++k;
      if (b == '5') out.push_back({Key::PageUp, 0});
      else if (b == '6') out.push_back({Key::PageDown, 0});
      else if (b == '1' || b == '7') out.push_back({Key::Home, 0});
      else if (b == '4' || b == '8') out.push_back({Key::End, 0});
      continue;
    }
    // Unknown sequence: drop its parameter bytes
    while (k < n && (buf[k] < '@' || buf[k] > '~')) ++k;
    if (k < n) ++k;
  }
  return out;
}

tasktop::model::VisibleRange UIState::visible() const {
  size_t end = std::min(total, scroll + page_rows);
  return {std::min(scroll, end), end};
}

void UIState::clamp() {
  if (total == 0) { selected = 0; scroll = 0; return; }
  if (selected >= total) selected = total - 1;
  const size_t rows = std::max<size_t>(1, page_rows);
  if (selected < scroll) scroll = selected;
  if (selected >= scroll + rows) scroll = selected - rows + 1;
  const size_t max_scroll = total > rows ? total - rows : 0;
  if (scroll > max_scroll) scroll = max_scroll;
}

static void move_by(UIState& st, long delta) {
  if (st.total == 0) return;
  long target = static_cast<long>(st.selected) + delta;
  target = std::clamp(target, 0L, static_cast<long>(st.total) - 1);
  st.selected = static_cast<size_t>(target);
  st.clamp();
}

static bool navigate(UIState& st, Key key) {
  const long page = static_cast<long>(std::max<size_t>(1, st.page_rows > 1 ? st.page_rows - 1 : 1));
  switch (key) {
    case Key::Up: move_by(st, -1); return true;
    case Key::Down: move_by(st, 1); return true;
    case Key::PageUp: move_by(st, -page); return true;
    case Key::PageDown: move_by(st, page); return true;
    case Key::Home: st.selected = 0; st.clamp(); return true;
    case Key::End: st.selected = st.total ? st.total - 1 : 0; st.clamp(); return true;
    default: return false;
  }
}

// Same key again flips the direction; a new key starts at its natural one
static void select_sort(UIState& st, SortKey key) {
  if (st.sort == key) {
    st.reverse = !st.reverse;
  } else {
    st.sort = key;
    st.reverse = (key == SortKey::Cpu || key == SortKey::Memory);
  }
}

static void search_changed(UIState& st) {
  st.selected = 0;
  st.scroll = 0;
}

Action handle_key(UIState& st, const KeyEvent& ev, size_t max_search_len) {
  switch (st.mode) {
    case Mode::Message:
      st.mode = Mode::Browse;
      return Action::Dismiss;

    case Mode::ConfirmKill:
      st.mode = Mode::Browse;
      if (ev.key == Key::Char && (ev.ch == 'y' || ev.ch == 'Y')) return Action::ConfirmKill;
      return Action::Dismiss;

    case Mode::Search:
      if (navigate(st, ev.key)) return Action::None;
      if (ev.key == Key::Enter) { st.mode = Mode::Browse; return Action::None; }
      if (ev.key == Key::Escape) { st.search.clear(); st.mode = Mode::Browse; search_changed(st); return Action::None; }
      if (ev.key == Key::Backspace) {
        if (!st.search.empty()) { st.search.pop_back(); search_changed(st); }
        return Action::None;
      }
      if (ev.key == Key::Char && st.search.size() < max_search_len) {
        st.search.push_back(ev.ch);
        search_changed(st);
      }
      return Action::None;

    case Mode::Browse:
      break;
  }

  if (navigate(st, ev.key)) return Action::None;
  if (ev.key == Key::Escape) {
    if (!st.search.empty()) { st.search.clear(); search_changed(st); }
    return Action::None;
  }
  if (ev.key != Key::Char) return Action::None;
  switch (ev.ch) {
    case 'q': case 'Q': return Action::Quit;
    case 'c': case 'C': select_sort(st, SortKey::Cpu); return Action::None;
    case 'm': case 'M': select_sort(st, SortKey::Memory); return Action::None;
    case 'p': case 'P': select_sort(st, SortKey::Pid); return Action::None;
    case 'n': case 'N': select_sort(st, SortKey::Name); return Action::None;
    case '/': case 'r': case 'R': st.mode = Mode::Search; return Action::None;
    case 't': case 'T': return st.total ? Action::ShowThreads : Action::None;
    case 'e': case 'E': return st.total ? Action::ShowExe : Action::None;
    case 'k': case 'K':
      if (!st.total) return Action::None;
      st.mode = Mode::ConfirmKill;
      return Action::RequestKill;
    default: return Action::None;
  }
}

} // namespace tasktop::ui
