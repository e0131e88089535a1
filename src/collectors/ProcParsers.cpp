#include "collectors/ProcParsers.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace tickwatch::collectors {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

// Pop the next whitespace-delimited token off the front of sv.
std::string_view next_token(std::string_view& sv) {
  size_t i = 0;
  while (i < sv.size() && is_space(sv[i])) ++i;
  size_t j = i;
  while (j < sv.size() && !is_space(sv[j])) ++j;
  auto tok = sv.substr(i, j - i);
  sv.remove_prefix(j);
  return tok;
}

template <typename T>
bool to_int(std::string_view tok, T& out) {
  if (tok.empty()) return false;
  auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), out);
  return ec == std::errc() && ptr == tok.data() + tok.size();
}

bool to_double(std::string_view tok, double& out) {
  if (tok.empty()) return false;
  std::string s(tok);
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}

uint64_t meminfo_value(std::string_view rest, bool& ok) {
  auto tok = next_token(rest);
  uint64_t v = 0;
  ok = to_int(tok, v);
  return v;
}

} // namespace

bool parse_stat(std::string_view content, StatFields& out) {
  // comm may contain spaces and parentheses: take the first '(' and the last ')'
  auto lp = content.find('(');
  auto rp = content.rfind(')');
  if (lp == std::string_view::npos || rp == std::string_view::npos || rp < lp) return false;
  out.comm = std::string(content.substr(lp + 1, rp - lp - 1));
  auto rest = content.substr(rp + 1);

  // Field numbers below follow proc(5); the state is field 3.
  auto st = next_token(rest);
  if (st.size() != 1) return false;
  out.state = st[0];
  if (!to_int(next_token(rest), out.ppid)) return false;
  // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i = 0; i < 9; ++i) {
    if (next_token(rest).empty()) return false;
  }
  if (!to_int(next_token(rest), out.utime)) return false;
  if (!to_int(next_token(rest), out.stime)) return false;
  // cutime cstime priority nice
  for (int i = 0; i < 4; ++i) {
    if (next_token(rest).empty()) return false;
  }
  if (!to_int(next_token(rest), out.num_threads)) return false;
  // itrealvalue starttime
  for (int i = 0; i < 2; ++i) {
    if (next_token(rest).empty()) return false;
  }
  if (!to_int(next_token(rest), out.vsize_bytes)) return false;
  if (!to_int(next_token(rest), out.rss_pages)) return false;
  return true;
}

bool parse_cpu_line(std::string_view line, model::CpuTimes& out) {
  auto label = next_token(line);
  if (!label.starts_with("cpu")) return false;
  uint64_t vals[10]{};
  int n = 0;
  while (n < 10) {
    auto tok = next_token(line);
    if (tok.empty()) break;
    if (!to_int(tok, vals[n])) return false;
    ++n;
  }
  // user nice system idle are present on every kernel; the rest arrived over time
  if (n < 4) return false;
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  out.guest = vals[8]; out.guest_nice = vals[9];
  return true;
}

bool parse_cpu_times(std::string_view text, model::CpuTimesSet& out) {
  out.per_core.clear();
  bool have_total = false;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    start = end + 1;
    if (line.starts_with("cpu ")) {
      if (!parse_cpu_line(line, out.total)) return false;
      have_total = true;
    } else if (line.starts_with("cpu")) {
      model::CoreTimes core{};
      auto label = line.substr(3, line.find_first_of(" \t") - 3);
      if (!to_int(label, core.index) || core.index < 0) return false;
      if (!parse_cpu_line(line, core.times)) return false;
      out.per_core.push_back(core);
    } else if (have_total) {
      break; // cpu block is contiguous at the top of the file
    }
  }
  return have_total;
}

bool parse_meminfo(std::string_view text, MemoryTotals& out) {
  out = MemoryTotals{};
  bool have_total = false;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    start = end + 1;
    bool ok = true;
    if (line.starts_with("MemTotal:")) { out.mem_total_kb = meminfo_value(line.substr(9), ok); have_total = ok; }
    else if (line.starts_with("MemFree:")) out.mem_free_kb = meminfo_value(line.substr(8), ok);
    else if (line.starts_with("SwapTotal:")) out.swap_total_kb = meminfo_value(line.substr(10), ok);
    else if (line.starts_with("SwapFree:")) out.swap_free_kb = meminfo_value(line.substr(9), ok);
    if (!ok) return false;
  }
  return have_total;
}

bool parse_loadavg(std::string_view text, model::LoadAverage& out) {
  return to_double(next_token(text), out.one)
      && to_double(next_token(text), out.five)
      && to_double(next_token(text), out.fifteen);
}

bool parse_uptime(std::string_view text, double& out) {
  return to_double(next_token(text), out) && out >= 0.0;
}

std::string parse_cmdline(const std::vector<unsigned char>& bytes) {
  std::string out;
  out.reserve(bytes.size());
  bool sep = true;
  for (auto b : bytes) {
    if (b == 0) {
      if (!sep) { out.push_back(' '); sep = true; }
    } else {
      out.push_back(static_cast<char>(b));
      sep = false;
    }
  }
  while (!out.empty() && is_space(out.back())) out.pop_back();
  return out;
}

} // namespace tickwatch::collectors
