#pragma once

#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tickwatch::ui {

// Indices into s.processes in display order for the given sort mode.
// Unknown CPU rates sort below every known rate.
std::vector<size_t> sort_order(const tickwatch::model::Snapshot& s, SortMode mode);

// Per-process CPU% as displayed: raw (one core = 100) or, on the total
// scale, divided by the online CPU count.
std::optional<double> display_cpu_pct(const tickwatch::model::ProcSample& p, int logical_threads);

// Process table rendering
std::vector<std::string> render_process_table(
    const tickwatch::model::Snapshot& s,
    int width,
    int target_rows
);

} // namespace tickwatch::ui
