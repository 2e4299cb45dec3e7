#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/ProcessTable.hpp"
#include "ui/Renderer.hpp"
#include <cstdlib>
#include <sstream>

using namespace tasktop::ui;
using tasktop::model::ProcessRecord;
using tasktop::model::SortKey;
using tasktop::model::Trend;

static ProcessRecord row(int32_t pid, const char* name, double cpu, double mem) {
  ProcessRecord r;
  r.pid = pid;
  r.name = name;
  r.cpu_pct = cpu;
  r.mem_mb = mem;
  r.status = "sleeping";
  return r;
}

TEST(box_ascii_layout) {
  setenv("LC_ALL", "C", 1);
  auto box = make_box("T", {"ab"}, 10, 3);
  ASSERT_EQ(box.size(), 5u);
  ASSERT_EQ(box[0], std::string("+-[ T ]--+"));
  ASSERT_EQ(box[1], std::string("|ab      |"));
  ASSERT_EQ(box[3], std::string("|        |"));
  ASSERT_EQ(box[4], std::string("+--------+"));
  unsetenv("LC_ALL");
}

TEST(process_row_columns) {
  auto p = row(123, "bash", 12.5, 100.0);
  p.cpu_trend = Trend::Rising;
  p.mem_trend = Trend::Falling;
  auto s = format_process_row(p, 60, false);
  ASSERT_EQ(display_cols(s), 60);
  ASSERT_TRUE(s.starts_with("    123  bash"));
  ASSERT_TRUE(s.find("12.5%^") != std::string::npos);
  ASSERT_TRUE(s.find("100.0v") != std::string::npos);
  ASSERT_TRUE(s.find("sleeping") != std::string::npos);
}

TEST(header_marks_sort_column) {
  UIState st;
  st.sort = SortKey::Memory;
  st.reverse = false;
  auto h = process_header_line(60, st, false);
  ASSERT_TRUE(h.find("MEM MB^") != std::string::npos);
  ASSERT_TRUE(h.find("CPU% ") != std::string::npos);
}

TEST(table_tracks_page_size_and_selection) {
  setenv("LC_ALL", "C", 1);
  std::vector<ProcessRecord> rows;
  for (int32_t pid = 1; pid <= 40; ++pid) rows.push_back(row(pid, "p", 0.0, 1.0));
  UIState st;
  st.selected = 35;
  auto box = render_process_table(rows, st, 80, 13);
  // Header row plus ten process rows between the borders
  ASSERT_EQ(box.size(), 13u);
  ASSERT_EQ(st.page_rows, 10u);
  ASSERT_EQ(st.total, 40u);
  ASSERT_EQ(st.scroll, 26u);
  ASSERT_TRUE(box[0].find("PROCESSES") != std::string::npos);
  unsetenv("LC_ALL");
}

TEST(once_output_is_plain_text) {
  std::vector<ProcessRecord> rows{row(7, "init", 0.0, 12.0), row(42, "sshd", 1.5, 8.0)};
  auto out = render_once(rows, 80);
  std::istringstream in(out);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) lines.push_back(line);
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_TRUE(lines[0].find("PID") != std::string::npos);
  ASSERT_TRUE(lines[2].starts_with("     42  sshd"));
  ASSERT_TRUE(lines[2].ends_with("sleeping"));
  ASSERT_TRUE(out.find('\x1B') == std::string::npos);
}
