#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "app/Config.hpp"

namespace tickwatch::ui {

constinit UIState g_ui{};

const UIConfig& ui_config() {
  static UIConfig uic = []{
    const auto& c = app::config();
    return UIConfig{
      sgr_color(6), sgr_color(3), sgr_color(1), sgr("90"),
      c.ui.caution_pct, c.ui.warning_pct
    };
  }();
  return uic;
}

void reset_ui_defaults() {
  bool threads = g_ui.show_threads; // sampler granularity is not a view setting
  g_ui = UIState{};
  g_ui.show_threads = threads;
  g_ui.cpu_scale = (app::config().ui.cpu_scale == "total") ? UIState::CPUScale::Total : UIState::CPUScale::Core;
}

void init_ui_state() {
  g_ui = UIState{};
  g_ui.show_threads = app::config().sampler.show_threads;
  g_ui.cpu_scale = (app::config().ui.cpu_scale == "total") ? UIState::CPUScale::Total : UIState::CPUScale::Core;
}

const char* to_string(SortMode m) {
  switch (m) {
    case SortMode::CPU: return "cpu";
    case SortMode::MEM: return "mem";
    case SortMode::PID: return "pid";
    case SortMode::NAME: return "name";
  }
  return "?";
}

} // namespace tickwatch::ui
