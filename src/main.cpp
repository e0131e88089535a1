#include "app/Config.hpp"
#include "app/Sampler.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

using namespace tickwatch;
using namespace tickwatch::ui;

namespace {

struct Options {
  app::Config cfg;
  int iterations{0}; // 0 => run until quit
  bool batch{false};
};

bool parse_int_arg(const char* s, int& out) {
  const char* end = s + std::strlen(s);
  auto [p, ec] = std::from_chars(s, end, out);
  return ec == std::errc{} && p == end;
}

void print_usage() {
  std::cout << "Usage: tickwatch [--interval-ms MS] [--threads] [--iterations N] [--batch]\n";
  std::cout << "Notes: interactive until 'q' or Ctrl+C; --batch prints N frames (default 2) as plain text.\n";
}

// Returns false after printing a diagnostic; exit_code tells main what to return.
bool parse_args(int argc, char** argv, Options& opt, int& exit_code) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "--interval-ms" || a == "--iterations") && i + 1 < argc) {
      int v = 0;
      if (!parse_int_arg(argv[++i], v) || v < 0) {
        std::fprintf(stderr, "tickwatch: invalid value for %s: %s\n", a.c_str(), argv[i]);
        exit_code = 2;
        return false;
      }
      if (a == "--iterations") opt.iterations = v;
      else opt.cfg.sampler.interval_ms = std::clamp(v, 100, 60000);
    }
    else if (a == "--threads") opt.cfg.sampler.show_threads = true;
    else if (a == "--batch") opt.batch = true;
    else if (a == "-h" || a == "--help") { print_usage(); exit_code = 0; return false; }
    else {
      std::fprintf(stderr, "tickwatch: unknown argument: %s\n", a.c_str());
      print_usage();
      exit_code = 2;
      return false;
    }
  }
  opt.cfg.sampler.warmup_ms = std::min(opt.cfg.sampler.warmup_ms, opt.cfg.sampler.interval_ms);
  return true;
}

int run_batch(app::EventChannel& events, int iterations) {
  if (iterations <= 0) iterations = 2; // the first frame has no rates yet
  int frames = 0;
  int rc = 0;
  while (frames < iterations && !g_interrupted.load()) {
    auto ev = events.recv_for(std::chrono::milliseconds(200));
    if (!ev) {
      if (events.closed()) break;
      continue;
    }
    if (auto* err = std::get_if<model::PassError>(&*ev)) {
      std::fprintf(stderr, "tickwatch: pass %llu failed: %s\n",
                   static_cast<unsigned long long>(err->seq), err->message.c_str());
      rc = 1;
      continue;
    }
    const auto& snap = std::get<model::Snapshot>(*ev);
    if (frames > 0) std::cout << "\n";
    std::cout << render_batch(snap);
    std::cout.flush();
    rc = 0;
    ++frames;
  }
  return rc;
}

int run_interactive(app::EventChannel& events, app::ControlChannel& control,
                    const Options& opt) {
  TerminalSession session(opt.cfg.ui.alt_screen);
  app::ControlOutbox outbox(control);

  const std::string help_text = "Keys: q quit  t threads  c/m/p/n sort  i CPU scale  arrows/PgUp/PgDn scroll  h help";
  std::optional<model::Snapshot> latest;
  std::string last_error;
  int frames = 0;
  while (!g_interrupted.load()) {
    bool dirty = g_resized.exchange(false);
    if (has_input_available(100)) {
      auto in = handle_keyboard_input();
      if (in.quit) break;
      if (in.toggle_threads) outbox.request(app::ControlMessage{g_ui.show_threads});
      dirty = true;
    }
    (void)outbox.flush();
    while (auto ev = events.try_recv()) {
      if (auto* err = std::get_if<model::PassError>(&*ev)) {
        last_error = err->message;
      } else {
        latest = std::move(std::get<model::Snapshot>(*ev));
        last_error.clear();
        ++frames;
      }
      dirty = true;
    }
    if (events.closed() && events.size() == 0 && !latest) break;
    if (dirty && latest) {
      std::string mode = latest->show_threads ? "threads" : "processes";
      if (outbox.pending() || latest->show_threads != g_ui.show_threads) mode += "...";
      std::string dyn_help = std::string("[sort:") + to_string(g_ui.sort) + "] [" + mode + "]  " + help_text;
      if (!render_screen(*latest, last_error, g_ui.show_help, dyn_help)) return 1;
    }
    if (opt.iterations > 0 && frames >= opt.iterations) break;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  install_signal_handlers();

  Options opt;
  opt.cfg = app::config();
  int exit_code = 0;
  if (!parse_args(argc, argv, opt, exit_code)) return exit_code;

  init_ui_state();
  g_ui.show_threads = opt.cfg.sampler.show_threads;

  app::EventChannel events(static_cast<size_t>(opt.cfg.sampler.channel_capacity));
  app::ControlChannel control(4);
  app::Sampler sampler(events, control, opt.cfg.sampler);
  // Pass errors reach the screen in interactive mode
  sampler.set_stderr_logging(opt.batch);
  sampler.start();

  int rc = opt.batch ? run_batch(events, opt.iterations)
                     : run_interactive(events, control, opt);

  // Closing our side ends the sampling loop at its next delivery or wait.
  events.close();
  control.close();
  sampler.stop();
  return rc;
}
