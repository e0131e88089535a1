#include "ui/Terminal.hpp"
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tickwatch::ui {

std::atomic<bool> g_interrupted{false};
std::atomic<bool> g_resized{false};

static void on_terminate(int) { g_interrupted.store(true); }
static void on_winch(int) { g_resized.store(true); }

void install_signal_handlers() {
  struct sigaction sa{};
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: poll() returns EINTR
  sa.sa_handler = on_terminate;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  ::sigaction(SIGHUP, &sa, nullptr);
  sa.sa_handler = on_winch;
  ::sigaction(SIGWINCH, &sa, nullptr);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool use_unicode() {
  for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* v = std::getenv(var);
    if (!v || !*v) continue;
    std::string s(v);
    for (auto& c : s) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    return s.contains("utf-8") || s.contains("utf8");
  }
  return false;
}

static int env_dimension(const char* name, int fallback) {
  const char* v = std::getenv(name);
  if (!v || !*v) return fallback;
  int out = 0;
  const char* end = v + std::strlen(v);
  auto [p, ec] = std::from_chars(v, end, out);
  return (ec == std::errc{} && p == end && out > 0) ? out : fallback;
}

TermSize terminal_size() {
  TermSize ts;
  struct winsize ws{};
  bool have = ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0;
  ts.cols = (have && ws.ws_col > 0) ? ws.ws_col : env_dimension("COLUMNS", 80);
  ts.rows = (have && ws.ws_row > 0) ? ws.ws_row : env_dimension("LINES", 24);
  if (ts.cols < 20) ts.cols = 20;
  return ts;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }

std::string sgr_bold() { return sgr("1"); }

std::string sgr_color(int idx) {
  if (idx < 0) idx = 0;
  if (idx <= 7) return sgr(std::to_string(30 + idx).c_str());
  if (idx <= 15) return sgr(std::to_string(90 + (idx - 8)).c_str());
  return sgr(("38;5;" + std::to_string(idx)).c_str());
}

bool write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(static_cast<size_t>(n));
  }
  return true;
}

TerminalSession::TerminalSession(bool alt_screen) {
  if (::isatty(STDIN_FILENO) == 1 && ::tcgetattr(STDIN_FILENO, &saved_) == 0) {
    termios t = saved_;
    t.c_lflag &= ~(ICANON | ECHO); // ISIG stays on so Ctrl+C raises SIGINT
    t.c_cc[VMIN] = 0;
    t.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &t) == 0) {
      raw_ = true;
      saved_flags_ = ::fcntl(STDIN_FILENO, F_GETFL, 0);
      ::fcntl(STDIN_FILENO, F_SETFL, saved_flags_ | O_NONBLOCK);
    }
  }
  if (!tty_stdout()) return;
  alt_ = alt_screen;
  cursor_hidden_ = true;
  // alt screen on, clear, home, hide cursor
  write_all(STDOUT_FILENO, alt_ ? "\x1B[?1049h\x1B[2J\x1B[H\x1B[?25l" : "\x1B[2J\x1B[H\x1B[?25l");
}

TerminalSession::~TerminalSession() {
  if (cursor_hidden_) {
    write_all(STDOUT_FILENO, "\x1B[0m\x1B[?25h");
    if (alt_) write_all(STDOUT_FILENO, "\x1B[?1049l");
    else write_all(STDOUT_FILENO, "\n");
  }
  if (raw_) {
    ::fcntl(STDIN_FILENO, F_SETFL, saved_flags_);
    ::tcsetattr(STDIN_FILENO, TCSADRAIN, &saved_);
  }
}

} // namespace tickwatch::ui
