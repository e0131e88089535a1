#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "model/Cpu.hpp"
#include "model/Process.hpp"

namespace tickwatch::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t free_kb{};
  uint64_t used_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_free_kb{};
  uint64_t swap_used_kb{};
  double   used_pct{}; // 0..100
};

struct LoadAverage {
  double one{}, five{}, fifteen{};
};

struct Snapshot {
  uint64_t seq{};
  std::vector<ProcSample> processes; // enumeration order; the UI sorts
  TaskCounts counts;
  double uptime_s{};
  LoadAverage load;
  Memory mem;
  CpuSnapshot cpu;
  bool show_threads{false};
  // Entities that vanished or failed to parse during this pass
  size_t skipped{};
  // Human-readable notes for fields that degraded to defaults this pass
  std::string status;
};

// Emitted instead of a Snapshot when a pass cannot produce one.
struct PassError {
  uint64_t seq{};
  std::string message;
};

using SamplerEvent = std::variant<Snapshot, PassError>;

} // namespace tickwatch::model
