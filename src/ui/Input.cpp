#include "ui/Input.hpp"
#include "ui/Config.hpp"
#include <unistd.h>
#include <poll.h>
#include <algorithm>

namespace tickwatch::ui {

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

InputResult decode_keys(const unsigned char* buf, size_t n) {
  InputResult res;
  size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == 'q' || c == 'Q') { res.quit = true; return res; }
    else if (c == 'h' || c == 'H') { g_ui.show_help = !g_ui.show_help; }
    else if (c == 'c' || c == 'C') { g_ui.sort = SortMode::CPU; }
    else if (c == 'm' || c == 'M') { g_ui.sort = SortMode::MEM; }
    else if (c == 'p' || c == 'P') { g_ui.sort = SortMode::PID; }
    else if (c == 'n' || c == 'N') { g_ui.sort = SortMode::NAME; }
    else if (c == 't' || c == 'T') {
      // flipping twice in one chunk cancels out
      res.toggle_threads = !res.toggle_threads;
      g_ui.show_threads = !g_ui.show_threads;
      g_ui.scroll = 0;
    }
    else if (c == 'i' || c == 'I') {
      g_ui.cpu_scale = (g_ui.cpu_scale==UIState::CPUScale::Total? UIState::CPUScale::Core : UIState::CPUScale::Total);
    }
    else if (c == 'R') { reset_ui_defaults(); }
    else if (c == 0x1B) {
      // ESC sequences
      unsigned char a=0,b=0, d=0;
      if (k < n) a = buf[k++]; else break;
      if (a == '[') {
        if (k < n) b = buf[k++]; else break;
        int max_scroll = std::max(0, g_ui.last_proc_total - g_ui.last_proc_page_rows);
        if (b == 'A') { if (g_ui.scroll > 0) g_ui.scroll--; }
        else if (b == 'B') { g_ui.scroll = std::min(g_ui.scroll + 1, max_scroll); }
        else if (b=='5' || b=='6') {
          if (k < n) d = buf[k++];
          if (d=='~') {
            int page = std::max(1, g_ui.last_proc_page_rows - 2);
            if (b=='5') { g_ui.scroll = std::max(0, g_ui.scroll - page); }
            else { g_ui.scroll = std::min(g_ui.scroll + page, max_scroll); }
          }
        }
      }
    }
  }
  return res;
}

InputResult handle_keyboard_input() {
  unsigned char buf[16];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return decode_keys(buf, static_cast<size_t>(n));
}

} // namespace tickwatch::ui
