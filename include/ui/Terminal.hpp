#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <termios.h>

namespace tickwatch::ui {

// Set from signal handlers; the frame loop polls both.
extern std::atomic<bool> g_interrupted; // SIGINT, SIGTERM, SIGHUP
extern std::atomic<bool> g_resized;     // SIGWINCH

// Handlers only store to the flags above; they do not restart poll(), so the
// frame loop sees the flag within one poll timeout.
void install_signal_handlers();

struct TermSize {
  int cols{80};
  int rows{24};
};

[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();
// ioctl size, then $COLUMNS/$LINES, then 80x24
[[nodiscard]] TermSize terminal_size();

// SGR sequences; empty when stdout is not a tty
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_color(int idx); // 0-15 palette, 16+ 256-colour

// Writes all of `data`, retrying short writes and EINTR. Returns false on error.
bool write_all(int fd, std::string_view data);

// Interactive session on the controlling terminal: non-canonical, non-blocking
// stdin without echo, hidden cursor, optional alternate screen. Everything is
// undone in reverse order on destruction.
class TerminalSession {
public:
  explicit TerminalSession(bool alt_screen);
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  bool raw() const { return raw_; }

private:
  termios saved_{};
  int saved_flags_{0};
  bool raw_{false};
  bool cursor_hidden_{false};
  bool alt_{false};
};

} // namespace tickwatch::ui
