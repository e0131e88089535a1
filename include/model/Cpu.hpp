#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace tickwatch::model {

// Cumulative jiffies for one line of /proc/stat.
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{}, guest{}, guest_nice{};

  // Sums saturate instead of wrapping so a corrupt line cannot fake a huge delta.
  uint64_t work() const {
    return sat_add(sat_add(sat_add(sat_add(user, system), nice), irq), softirq);
  }
  uint64_t total() const {
    return sat_add(sat_add(sat_add(sat_add(sat_add(work(), idle), iowait), steal), guest), guest_nice);
  }

private:
  static uint64_t sat_add(uint64_t a, uint64_t b) {
    return (a > UINT64_MAX - b) ? UINT64_MAX : a + b;
  }
};

// One cpuN line. index is the N; offline CPUs leave gaps.
struct CoreTimes {
  int index{};
  CpuTimes times{};
};

// Aggregate line plus one entry per online CPU, from a single read of /proc/stat.
struct CpuTimesSet {
  CpuTimes total{};
  std::vector<CoreTimes> per_core;
};

struct CoreUsage {
  int index{};
  std::optional<double> pct; // 0..100, unset until the CPU has a baseline
};

struct CpuSnapshot {
  CpuTimesSet times{};
  std::optional<double> usage_pct; // aggregate 0..100, unset on the first pass
  std::vector<CoreUsage> per_core; // same order as times.per_core
  int logical_threads{0};          // online CPUs this pass
};

} // namespace tickwatch::model
