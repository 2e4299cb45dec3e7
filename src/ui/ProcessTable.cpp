#include "ui/ProcessTable.hpp"
#include "app/Trend.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tasktop::ui {

using tasktop::model::ProcessRecord;
using tasktop::model::SortKey;

static constexpr int kPidW = 7;
static constexpr int kCpuW = 7;   // "100.0%" plus arrow column
static constexpr int kMemW = 10;  // "12345.6" plus arrow column
static constexpr int kStatusW = 12;
static constexpr int kMinNameW = 8;

static int name_width(int iw) {
  return std::max(kMinNameW, iw - (kPidW + 2 + 2 + kCpuW + 1 + 2 + kMemW + 1 + 2 + kStatusW));
}

static const char* header_mark(const UIState& st, SortKey key, bool unicode) {
  if (st.sort != key) return " ";
  if (unicode) return st.reverse ? "▼" : "▲";
  return st.reverse ? "v" : "^";
}

std::string process_header_line(int iw, const UIState& st, bool unicode) {
  const int nw = name_width(iw);
  std::ostringstream h;
  h << std::setw(kPidW) << "PID" << header_mark(st, SortKey::Pid, unicode) << " "
    << trunc_pad(std::string("NAME") + header_mark(st, SortKey::Name, unicode), nw) << "  "
    << std::setw(kCpuW) << "CPU%" << header_mark(st, SortKey::Cpu, unicode) << "  "
    << std::setw(kMemW) << "MEM MB" << header_mark(st, SortKey::Memory, unicode) << "  "
    << "STATUS";
  return trunc_pad(h.str(), iw);
}

std::string format_process_row(const ProcessRecord& p, int iw, bool unicode) {
  const int nw = name_width(iw);
  std::ostringstream os;
  os << std::setw(kPidW) << p.pid << "  "
     << trunc_pad(p.name, nw) << "  "
     << std::setw(kCpuW - 1) << format_fixed(p.cpu_pct, 1) << "%"
     << tasktop::app::trend_arrow(p.cpu_trend, unicode) << "  "
     << std::setw(kMemW) << format_fixed(p.mem_mb, 1)
     << tasktop::app::trend_arrow(p.mem_trend, unicode) << "  "
     << trunc_pad(p.status, kStatusW);
  return trunc_pad(os.str(), iw);
}

std::vector<std::string> render_process_table(
    const std::vector<ProcessRecord>& rows,
    UIState& st,
    int width,
    int target_rows
) {
  const int iw = std::max(3, width - 2);
  const bool uni = use_unicode();
  // borders and the column header take three lines
  const int body = std::max(1, target_rows - 3);
  st.page_rows = static_cast<size_t>(body);
  st.total = rows.size();
  st.clamp();

  std::vector<std::string> lines;
  lines.reserve(static_cast<size_t>(body) + 1);
  lines.push_back(process_header_line(iw, st, uni));
  auto vr = st.visible();
  for (size_t i = vr.start; i < vr.end; ++i) lines.push_back(format_process_row(rows[i], iw, uni));

  std::string title = "PROCESSES";
  if (!st.search.empty() || st.mode == Mode::Search) title += " /" + st.search;
  auto box = make_box(title, lines, width, body + 1);
  if (!tty_stdout()) return box;

  // Color the row text between the borders: selection, new, CPU severity
  const auto& cfg = config();
  for (size_t i = vr.start; i < vr.end; ++i) {
    auto& line = box[2 + (i - vr.start)];
    const auto& p = rows[i];
    std::string col;
    if (i == st.selected) col = sgr("7");
    else if (p.is_new) col = cfg.colors.fresh;
    else if (p.cpu_pct >= cfg.thresholds.cpu_caution_pct) col = cpu_color(p.cpu_pct);
    if (col.empty()) continue;
    line = wrap_inner(line, col);
  }
  return box;
}

} // namespace tasktop::ui
