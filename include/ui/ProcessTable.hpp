#pragma once

#include "model/Process.hpp"
#include "ui/Input.hpp"
#include <string>
#include <vector>

namespace tasktop::ui {

// Column header line for a table of the given inner width
std::string process_header_line(int iw, const UIState& st, bool unicode);

// One uncolored row: PID, NAME, CPU% + arrow, MEM MB + arrow, STATUS
std::string format_process_row(const tasktop::model::ProcessRecord& p, int iw, bool unicode);

// Boxed, colored table of the rows in st.visible(). Updates st.page_rows
// to the number of rows that fit in target_rows.
std::vector<std::string> render_process_table(
    const std::vector<tasktop::model::ProcessRecord>& rows,
    UIState& st,
    int width,
    int target_rows
);

} // namespace tasktop::ui
