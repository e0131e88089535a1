#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tickwatch::ui {

// UTF-8 text width utilities (ANSI SGR sequences count as zero columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Replace control bytes with '?' and cap the byte length at max_len
std::string sanitize_for_display(const std::string& s, int max_len);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// 1536 -> "1.50k", 3 GiB -> "3.00G"; fixed_width right-aligns to 8 columns
std::string human_bytes(uint64_t bytes, bool fixed_width = false);
// "2 days, 03:04:05" or "03:04:05"
std::string human_duration(double seconds);
// "12.3" or "?" when no baseline exists yet
std::string format_pct(const std::optional<double>& pct);

// Login name for a uid via /etc/passwd, cached; the numeric uid if unknown.
std::string user_name(uint32_t uid);

} // namespace tickwatch::ui
