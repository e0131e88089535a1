#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace tickwatch::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string sanitize_for_display(const std::string& s, int max_len) {
  std::string out;
  size_t cap = max_len > 0 ? (size_t)max_len * 4 : 0; // room for multibyte glyphs
  out.reserve(std::min(s.size(), cap));
  for (unsigned char c : s) {
    if (out.size() >= cap) break;
    out.push_back((c < 0x20 || c == 0x7F) ? '?' : (char)c);
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "\xE2\x80\xA6" : ".");
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

std::string human_bytes(uint64_t bytes, bool fixed_width) {
  char buf[32];
  if (bytes <= 1024) {
    std::snprintf(buf, sizeof(buf), fixed_width ? "%8llu" : "%llu", static_cast<unsigned long long>(bytes));
    return buf;
  }
  static constexpr struct { uint64_t unit; char prefix; } steps[] = {
    {1ull << 40, 'T'}, {1ull << 30, 'G'}, {1ull << 20, 'M'}, {1ull << 10, 'k'},
  };
  for (const auto& st : steps) {
    if (bytes >= st.unit || st.prefix == 'k') {
      double v = static_cast<double>(bytes) / static_cast<double>(st.unit);
      std::snprintf(buf, sizeof(buf), fixed_width ? "%7.2f%c" : "%.2f%c", v, st.prefix);
      return buf;
    }
  }
  return buf;
}

std::string human_duration(double seconds) {
  uint64_t secs = seconds > 0.0 ? static_cast<uint64_t>(seconds) : 0;
  uint64_t days = secs / 86400; secs %= 86400;
  uint64_t hours = secs / 3600; secs %= 3600;
  uint64_t mins = secs / 60; secs %= 60;
  char buf[64];
  if (days > 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s, %02llu:%02llu:%02llu",
                  (unsigned long long)days, days > 1 ? "days" : "day",
                  (unsigned long long)hours, (unsigned long long)mins, (unsigned long long)secs);
  } else {
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu",
                  (unsigned long long)hours, (unsigned long long)mins, (unsigned long long)secs);
  }
  return buf;
}

std::string format_pct(const std::optional<double>& pct) {
  if (!pct) return "?";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", *pct);
  return buf;
}

std::string user_name(uint32_t uid) {
  static std::unordered_map<uint32_t, std::string> cache;
  auto it = cache.find(uid);
  if (it != cache.end()) return it->second;
  std::ifstream pw("/etc/passwd"); std::string pl;
  std::string name = std::to_string(uid);
  while (std::getline(pw, pl)) {
    auto c1 = pl.find(':'); if (c1==std::string::npos) continue;
    auto c2 = pl.find(':', c1+1); if (c2==std::string::npos) continue;
    uint32_t fuid = std::strtoul(pl.c_str()+c2+1, nullptr, 10);
    if (fuid==uid) { name = pl.substr(0, c1); break; }
  }
  cache.emplace(uid, name);
  return name;
}

} // namespace tickwatch::ui
