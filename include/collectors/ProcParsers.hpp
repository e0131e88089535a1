#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "model/Snapshot.hpp"

namespace tickwatch::collectors {

// Fields of /proc/<pid>/stat the sampler consumes.
struct StatFields {
  std::string comm;
  char state{'?'};
  int32_t ppid{};
  uint64_t utime{};
  uint64_t stime{};
  int64_t num_threads{};
  uint64_t vsize_bytes{};
  int64_t rss_pages{};
};

struct MemoryTotals {
  uint64_t mem_total_kb{};
  uint64_t mem_free_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_free_kb{};
};

// All parsers return false on malformed input and leave `out` unspecified.
[[nodiscard]] bool parse_stat(std::string_view content, StatFields& out);
[[nodiscard]] bool parse_cpu_line(std::string_view line, model::CpuTimes& out);
[[nodiscard]] bool parse_cpu_times(std::string_view text, model::CpuTimesSet& out);
[[nodiscard]] bool parse_meminfo(std::string_view text, MemoryTotals& out);
[[nodiscard]] bool parse_loadavg(std::string_view text, model::LoadAverage& out);
[[nodiscard]] bool parse_uptime(std::string_view text, double& out);

// NUL-separated argv to a single space-joined, trimmed line.
std::string parse_cmdline(const std::vector<unsigned char>& bytes);

} // namespace tickwatch::collectors
