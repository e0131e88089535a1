#include "ui/ProcessTable.hpp"
#include "ui/Terminal.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <numeric>

namespace tickwatch::ui {

// CPU% column, 6 wide; "?" until the entity has a baseline
static std::string fmt_cpu_field(const std::optional<double>& cpu_pct, bool colorize) {
  std::string digits = format_pct(cpu_pct);
  int pad = 6 - (int)digits.size(); if (pad < 0) pad = 0;

  const auto& ui = ui_config();
  const std::string* col = nullptr;
  if (colorize && cpu_pct) {
    int v = (int)(*cpu_pct + 0.5);
    if (v >= ui.warning_pct) col = &ui.warning;
    else if (v >= ui.caution_pct) col = &ui.caution;
  }

  std::string out;
  out.append(pad, ' ');
  if (col) out += *col;
  out += digits;
  if (col) out += sgr_reset();
  out += "  ";
  return out;
}

std::optional<double> display_cpu_pct(const model::ProcSample& p, int logical_threads) {
  if (!p.cpu_pct) return std::nullopt;
  if (g_ui.cpu_scale == UIState::CPUScale::Total) return *p.cpu_pct / (double)std::max(1, logical_threads);
  return p.cpu_pct;
}

std::vector<size_t> sort_order(const tickwatch::model::Snapshot& s, SortMode mode) {
  const auto& procs = s.processes;
  std::vector<size_t> order(procs.size());
  std::iota(order.begin(), order.end(), 0);
  auto cpu_key = [&](size_t i){ return procs[i].cpu_pct.value_or(-1.0); };
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b){
    const auto& A = procs[a];
    const auto& B = procs[b];
    switch (mode) {
      case SortMode::CPU:
        if (cpu_key(a) != cpu_key(b)) return cpu_key(a) > cpu_key(b);
        break;
      case SortMode::MEM:
        if (A.rss_bytes != B.rss_bytes) return A.rss_bytes > B.rss_bytes;
        break;
      case SortMode::PID:
        if (A.pid != B.pid) return A.pid < B.pid;
        break;
      case SortMode::NAME:
        if (A.name != B.name) return A.name < B.name;
        break;
    }
    // tiebreaker: higher CPU, then higher MEM, then lower PID
    if (cpu_key(a) != cpu_key(b)) return cpu_key(a) > cpu_key(b);
    if (A.rss_bytes != B.rss_bytes) return A.rss_bytes > B.rss_bytes;
    return A.pid < B.pid;
  });
  return order;
}

std::vector<std::string> render_process_table(
    const tickwatch::model::Snapshot& s,
    int width,
    int target_rows
) {
  int iw = std::max(3, width - 2);

  std::vector<std::string> proc_lines; proc_lines.reserve(64);
  std::vector<int> proc_sev; proc_sev.reserve(64); // 0=none,1=caution,2=warning
  auto order = sort_order(s, g_ui.sort);

  int proc_inner_min = std::max(5, target_rows - 2);  // minus borders
  int desired_rows = std::max(1, proc_inner_min - 1);  // minus header row
  g_ui.last_proc_page_rows = desired_rows;
  g_ui.last_proc_total = (int)order.size();
  int max_scroll = std::max(0, g_ui.last_proc_total - desired_rows);
  if (g_ui.scroll > max_scroll) g_ui.scroll = max_scroll;

  const int skip = g_ui.scroll;
  int limit = std::min((int)order.size(), skip + desired_rows);

  // Measure every row so columns don't shift when scrolling
  int pidw = 5, userw = 4;
  for (size_t idx : order) {
    const auto& p = s.processes[idx];
    pidw = std::max(pidw, (int)std::to_string(p.pid).size());
    if (p.uid) userw = std::max(userw, (int)user_name(*p.uid).size());
  }
  pidw = std::min(8, pidw);
  userw = std::min(12, userw);
  const int memw = 8;

  {
    std::ostringstream h;
    h << std::setw(pidw) << (s.show_threads ? "TID" : "PID") << "  "
      << rpad_trunc("USER", userw) << "  "
      << "S  "
      << std::setw(6) << "CPU%" << "  "
      << std::setw(memw) << "RES" << "  "
      << std::setw(memw) << "VIRT" << "  "
      << "COMMAND";
    proc_lines.push_back(h.str());
  }
  proc_sev.push_back(0);
  int cmd_w = iw - (pidw+2 + userw+2 + 3 + 8 + (memw+2)*2);
  if (cmd_w < 8) cmd_w = 8;

  const auto& ui = ui_config();
  for (int i = skip; i < limit; ++i) {
    const auto& p = s.processes[order[(size_t)i]];
    auto cpu = display_cpu_pct(p, s.cpu.logical_threads);
    int severity = 0;
    if (cpu) {
      int v = (int)(*cpu + 0.5);
      if (v >= ui.warning_pct) severity = 2;
      else if (v >= ui.caution_pct) severity = 1;
    }
    std::string user = p.uid ? user_name(*p.uid) : std::string("?");

    std::ostringstream os;
    os << std::setw(pidw) << p.pid << "  "
       << rpad_trunc(sanitize_for_display(user, userw), userw) << "  "
       << p.state << "  "
       << fmt_cpu_field(cpu, severity == 0)
       << human_bytes(p.rss_bytes, true) << "  "
       << human_bytes(p.vsize_bytes, true) << "  ";

    // Kernel threads show their comm in brackets, like top and ps
    std::string proc_name = p.kind == model::ProcessKind::KernelThread
        ? "[" + p.name + "]"
        : (p.cmd.empty() ? p.name : p.cmd);
    os << trunc_pad(sanitize_for_display(proc_name, cmd_w + 10), cmd_w);
    proc_lines.push_back(os.str());
    proc_sev.push_back(severity);
  }

  std::string title = s.show_threads ? "THREADS" : "PROCESSES";
  auto proc_box = make_box(title, proc_lines, width, proc_inner_min);
  {
    const std::string V = use_unicode() ? "\xE2\x94\x82" : "|";
    for (int li = 1; li < (int)proc_box.size() - 1; ++li) {
      if (li - 1 >= (int)proc_sev.size()) break;
      int sev = proc_sev[li-1];
      if (sev <= 0) continue;
      auto& line = proc_box[li];
      size_t fpos = line.find(V);
      size_t lpos = line.rfind(V);
      if (fpos == std::string::npos || lpos == std::string::npos || lpos <= fpos) continue;
      size_t start = fpos + V.size();
      const std::string& col = (sev==2) ? ui.warning : ui.caution;
      line = line.substr(0, start) + col + line.substr(start, lpos - start) + sgr_reset() + line.substr(lpos);
    }
  }
  return proc_box;
}

} // namespace tickwatch::ui
