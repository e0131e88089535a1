#pragma once

#include <cstddef>

namespace tickwatch::ui {

struct InputResult {
  bool quit{false};
  bool toggle_threads{false}; // caller forwards this to the sampler
};

// Decode a chunk of raw keyboard bytes, applying view changes to g_ui.
InputResult decode_keys(const unsigned char* buf, size_t n);

// Read whatever is pending on stdin and decode it
InputResult handle_keyboard_input();

// Helper to check for available input
bool has_input_available(int timeout_ms);

} // namespace tickwatch::ui
