#include "ui/Renderer.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/Formatting.hpp"
#include "ui/ProcessTable.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace tickwatch::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
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
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - (int)t.size());
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string colorize_line(const std::string& s) {
  if (!tty_stdout()) return s;
  const auto& ui = ui_config();
  const bool uni = use_unicode();
  const char* V = uni ? "│" : "|";

  auto is_border = [&](const std::string& str){
    if (str.empty() || str.find(V) != std::string::npos) return false;
    if (uni) return str.starts_with("╭") || str.starts_with("╰");
    return str.starts_with("+");
  };

  if (is_border(s)) {
    size_t lb = s.find('[');
    size_t rb = (lb!=std::string::npos) ? s.find(']', lb+1) : std::string::npos;
    if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
      return ui.muted + s.substr(0, lb) + ui.accent + s.substr(lb, rb - lb + 1)
           + ui.muted + s.substr(rb + 1) + sgr_reset();
    }
    return ui.muted + s + sgr_reset();
  }

  size_t fpos = s.find(V);
  size_t lpos = s.rfind(V);
  if (fpos != std::string::npos && lpos != std::string::npos && lpos > fpos) {
    size_t vl = std::strlen(V);
    return s.substr(0, fpos) + ui.muted + s.substr(fpos, vl) + sgr_reset()
         + s.substr(fpos + vl, lpos - (fpos + vl))
         + ui.muted + s.substr(lpos, vl) + sgr_reset() + s.substr(lpos + vl);
  }
  return s;
}

static std::string fmt1(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

std::vector<std::string> render_summary(const tickwatch::model::Snapshot& s, int width) {
  std::vector<std::string> lines;
  char buf[256];

  std::snprintf(buf, sizeof(buf), "up %s,  load average: %.2f, %.2f, %.2f",
                human_duration(s.uptime_s).c_str(), s.load.one, s.load.five, s.load.fifteen);
  lines.emplace_back(buf);

  const auto& c = s.counts;
  std::string tasks = std::to_string(s.processes.size()) + (s.show_threads ? " threads" : " processes")
      + ": " + std::to_string(c.tasks) + " tasks, " + std::to_string(c.kernel_threads) + " kthreads";
  if (s.show_threads) tasks += ", " + std::to_string(c.thread_records) + " thread records";
  else tasks += ", " + std::to_string(c.threads) + " threads";
  lines.push_back(tasks);

  {
    std::string cpu = "CPU: " + format_pct(s.cpu.usage_pct) + "%  ("
        + std::to_string(s.cpu.logical_threads) + " logical, scale="
        + (g_ui.cpu_scale == UIState::CPUScale::Total ? "total" : "core") + ")";
    lines.push_back(cpu);
    // Per-core rates, as many as fit on one line
    std::string cores;
    for (const auto& core : s.cpu.per_core) {
      std::string cell = "cpu" + std::to_string(core.index) + " " + format_pct(core.pct) + "%  ";
      if (display_cols(cores) + display_cols(cell) > width) break;
      cores += cell;
    }
    if (!cores.empty()) lines.push_back(cores);
  }

  const auto& m = s.mem;
  lines.push_back("Mem: " + human_bytes(m.used_kb * 1024) + " used / " + human_bytes(m.total_kb * 1024)
                  + " total (" + fmt1(m.used_pct) + "%)");
  lines.push_back("Swap: " + human_bytes(m.swap_used_kb * 1024) + " used / "
                  + human_bytes(m.swap_total_kb * 1024) + " total");
  if (!s.status.empty()) lines.push_back("note: " + s.status);
  if (s.skipped > 0) lines.push_back("skipped " + std::to_string(s.skipped) + " vanished entries");
  return lines;
}

bool render_screen(const tickwatch::model::Snapshot& s, const std::string& error,
                   bool show_help_line, const std::string& help_text) {
  auto [cols, rows] = terminal_size();
  auto summary = render_summary(s, cols - 2);
  auto top = make_box("TICKWATCH", summary, cols);
  int header_lines = (show_help_line?1:0) + (int)top.size();
  int footer_lines = error.empty() ? 0 : 1;
  int table_rows = std::max(5, rows - header_lines - footer_lines);
  auto table = render_process_table(s, cols, table_rows);

  std::string frame; frame.reserve((size_t)rows * (size_t)cols + 64);
  frame += "\x1B[H";
  std::vector<std::string> body;
  if (show_help_line) body.push_back(sgr_bold() + trunc_pad(help_text, cols) + sgr_reset());
  for (auto& l : top) body.push_back(colorize_line(l));
  for (auto& l : table) body.push_back(colorize_line(l));
  int body_lines = std::max(0, rows - footer_lines);
  for (int row = 0; row < body_lines; ++row) {
    std::string line = row < (int)body.size() ? body[row] : std::string();
    int vis = display_cols(line);
    if (vis < cols) line += std::string(cols - vis, ' ');
    frame += line;
    if (row < rows - 1) frame += "\n";
  }
  if (footer_lines) {
    frame += ui_config().warning + trunc_pad("error: " + error, cols) + sgr_reset();
  }
  frame += "\x1B[" + std::to_string(rows) + ";" + std::to_string(cols) + "H";
  return write_all(STDOUT_FILENO, frame);
}

std::string render_batch(const tickwatch::model::Snapshot& s) {
  std::ostringstream os;
  for (const auto& l : render_summary(s, 200)) os << l << "\n";
  os << "\n";
  os << std::setw(7) << (s.show_threads ? "TID" : "PID") << " "
     << std::setw(7) << "TGID" << " S "
     << std::setw(6) << "CPU%" << " "
     << std::setw(8) << "RES" << " "
     << std::setw(8) << "VIRT" << " "
     << std::setw(7) << "KIND" << " COMMAND\n";
  for (size_t idx : sort_order(s, g_ui.sort)) {
    const auto& p = s.processes[idx];
    std::string cmd = p.kind == model::ProcessKind::KernelThread ? "[" + p.name + "]"
                    : (p.cmd.empty() ? p.name : p.cmd);
    os << std::setw(7) << p.pid << " "
       << std::setw(7) << p.tgid << " " << p.state << " "
       << std::setw(6) << format_pct(display_cpu_pct(p, s.cpu.logical_threads)) << " "
       << human_bytes(p.rss_bytes, true) << " "
       << human_bytes(p.vsize_bytes, true) << " "
       << std::setw(7) << model::to_string(p.kind) << " "
       << sanitize_for_display(cmd, 512) << "\n";
  }
  return os.str();
}

} // namespace tickwatch::ui
