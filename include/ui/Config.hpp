#pragma once

#include <string>

namespace tickwatch::ui {

// Colours and thresholds resolved once from app::config()
struct UIConfig {
  std::string accent;
  std::string caution;
  std::string warning;
  std::string muted;
  int caution_pct;
  int warning_pct;
};

enum class SortMode { CPU, MEM, PID, NAME };

struct UIState {
  SortMode sort{SortMode::CPU};
  int scroll{0};
  bool show_help{false};
  bool show_threads{false};
  int last_proc_page_rows{14};
  int last_proc_total{0};
  // Core: 100% is one CPU fully busy. Total: 100% is the whole machine.
  enum class CPUScale { Total, Core } cpu_scale{CPUScale::Core};
};

// Global UI state, owned by the main thread
extern UIState g_ui;

const UIConfig& ui_config();
void reset_ui_defaults();
// Seed g_ui from the [ui] and [sampler] settings.
void init_ui_state();

const char* to_string(SortMode m);

} // namespace tickwatch::ui
