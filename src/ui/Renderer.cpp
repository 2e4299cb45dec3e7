#include "ui/Renderer.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/ProcessTable.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <algorithm>

namespace tasktop::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(static_cast<size_t>(std::max(0, n)) * ch.size());
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = take_cols("[ " + title + " ]", iw);
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max(static_cast<int>(lines.size()), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < static_cast<int>(lines.size())) ? lines[static_cast<size_t>(i)] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string wrap_inner(const std::string& line, const std::string& color) {
  if (color.empty()) return line;
  const std::string V = use_unicode() ? "│" : "|";
  size_t fpos = line.find(V);
  size_t lpos = line.rfind(V);
  if (fpos == std::string::npos || lpos == std::string::npos || lpos <= fpos) return color + line + sgr_reset();
  size_t start = fpos + V.size();
  return line.substr(0, start) + color + line.substr(start, lpos - start) + sgr_reset() + line.substr(lpos);
}

static std::string usage_field(const char* label, double pct, int meter_w) {
  return std::string(label) + " " + meter(pct, meter_w) + " " + format_fixed(pct, 1) + "%";
}

std::vector<std::string> render_header(const tasktop::model::SystemStats& s, const UIState& st, int width) {
  static const bool prefer12h = prefer_12h_clock_from_locale();
  const auto& cfg = config();
  std::vector<std::string> out;

  std::string left = cfg.colors.accent + "tasktop" + sgr_reset() + "  " + read_hostname() + "  up " + read_uptime_formatted();
  out.push_back(lr_align(width, left, format_time_now(prefer12h)));

  const int meter_w = std::clamp(width / 4, 10, 40);
  std::string cpu = usage_field("CPU", s.cpu.usage_pct, meter_w);
  std::string mem = usage_field("MEM", s.mem.used_pct, meter_w) + " " +
                    format_kb(s.mem.used_kb) + "/" + format_kb(s.mem.total_kb);
  out.push_back(trunc_pad(cpu_color(s.cpu.usage_pct) + cpu + sgr_reset() + "   " + mem, width));

  std::string info = "Tasks: " + std::to_string(s.process_count) +
                     "  Cores: " + std::to_string(s.cpu.logical_threads) +
                     "  Churn: " + std::to_string(s.churn_recent) +
                     "  Sort: " + tasktop::model::to_string(st.sort) + (st.reverse ? " desc" : " asc");
  out.push_back(trunc_pad(cfg.colors.muted + info + sgr_reset(), width));
  return out;
}

std::string render_footer(const UIState& st, int width) {
  std::string text;
  switch (st.mode) {
    case Mode::Search:
      text = "search: " + st.search + "_   Enter keep  Esc clear  Backspace delete";
      break;
    case Mode::ConfirmKill:
      text = "y confirm  any other key cancels";
      break;
    default:
      text = "q quit  arrows/PgUp/PgDn move  c/m/p/n sort  / search  t threads  e exe  k kill";
      break;
  }
  return trunc_pad(config().colors.muted + text + sgr_reset(), width);
}

static std::vector<std::string> dialog_box(const Dialog& d, int cols) {
  int widest = display_cols(d.hint);
  for (const auto& l : d.lines) widest = std::max(widest, display_cols(l));
  int w = std::clamp(widest + 4, 40, std::max(10, cols - 4));
  std::vector<std::string> lines;
  lines.reserve(d.lines.size() + 3);
  lines.push_back(std::string());
  for (const auto& l : d.lines) lines.push_back(" " + l);
  lines.push_back(std::string());
  lines.push_back(" " + d.hint);
  return make_box(d.title, lines, w);
}

std::vector<std::string> compose_frame(
    const tasktop::model::SystemStats& s,
    const std::vector<tasktop::model::ProcessRecord>& rows,
    UIState& st,
    const std::optional<Dialog>& dialog,
    int cols,
    int rows_total
) {
  std::vector<std::string> frame = render_header(s, st, cols);
  const int table_rows = std::max(4, rows_total - static_cast<int>(frame.size()) - 1);
  auto table = render_process_table(rows, st, cols, table_rows);
  frame.insert(frame.end(), table.begin(), table.end());
  frame.push_back(render_footer(st, cols));

  if (dialog) {
    auto box = dialog_box(*dialog, cols);
    const int bh = static_cast<int>(box.size());
    const int top = std::max(0, (static_cast<int>(frame.size()) - bh) / 2);
    const int left = std::max(0, (cols - display_cols(box.front())) / 2);
    for (int i = 0; i < bh && top + i < static_cast<int>(frame.size()); ++i) {
      frame[static_cast<size_t>(top + i)] =
          trunc_pad(std::string(static_cast<size_t>(left), ' ') + config().colors.accent +
                    box[static_cast<size_t>(i)] + sgr_reset(), cols);
    }
  }
  if (static_cast<int>(frame.size()) > rows_total) frame.resize(static_cast<size_t>(std::max(0, rows_total)));
  return frame;
}

void render_screen(
    const tasktop::model::SystemStats& s,
    const std::vector<tasktop::model::ProcessRecord>& rows,
    UIState& st,
    const std::optional<Dialog>& dialog
) {
  const int cols = term_cols();
  const int nrows = term_rows();
  auto lines = compose_frame(s, rows, st, dialog, cols, nrows);
  std::string frame;
  frame.reserve(static_cast<size_t>(nrows) * static_cast<size_t>(cols) + 64);
  frame += "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    frame += lines[i];
    frame += "\x1B[K";
    if (i + 1 < lines.size()) frame += "\n";
  }
  frame += "\x1B[J";
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

std::string render_once(const std::vector<tasktop::model::ProcessRecord>& rows, int width) {
  UIState st;
  std::string out = process_header_line(width, st, false) + "\n";
  for (const auto& p : rows) {
    std::string line = format_process_row(p, width, false);
    while (!line.empty() && line.back() == ' ') line.pop_back();
    out += line + "\n";
  }
  return out;
}

} // namespace tasktop::ui
