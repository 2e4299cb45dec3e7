#pragma once

#include "model/Process.hpp"
#include "model/Snapshot.hpp"
#include "ui/Input.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tasktop::ui {

struct Dialog {
  std::string title;
  std::vector<std::string> lines;
  std::string hint{"press any key to close"};
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Color the text between a box line's side borders
std::string wrap_inner(const std::string& line, const std::string& color);

std::vector<std::string> render_header(const tasktop::model::SystemStats& s, const UIState& st, int width);
std::string render_footer(const UIState& st, int width);

// Full frame, one string per terminal row
std::vector<std::string> compose_frame(
    const tasktop::model::SystemStats& s,
    const std::vector<tasktop::model::ProcessRecord>& rows,
    UIState& st,
    const std::optional<Dialog>& dialog,
    int cols,
    int rows_total
);

void render_screen(
    const tasktop::model::SystemStats& s,
    const std::vector<tasktop::model::ProcessRecord>& rows,
    UIState& st,
    const std::optional<Dialog>& dialog
);

// Plain table for --once
std::string render_once(const std::vector<tasktop::model::ProcessRecord>& rows, int width);

} // namespace tasktop::ui
