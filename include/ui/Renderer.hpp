#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace tickwatch::ui {

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Line colorization
std::string colorize_line(const std::string& s);

// top-style summary: uptime and load, task counts, CPU, memory, swap
std::vector<std::string> render_summary(const tickwatch::model::Snapshot& s, int width);

// Frame rendering. `error` is the most recent pass failure, shown on the
// last line until the next good snapshot clears it. False if stdout is gone.
bool render_screen(const tickwatch::model::Snapshot& s, const std::string& error,
                   bool show_help_line, const std::string& help_text);

// Plain-text frame for non-interactive output: summary, then every row.
// CPU% follows the same scale as the interactive table.
std::string render_batch(const tickwatch::model::Snapshot& s);

} // namespace tickwatch::ui
