#pragma once
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include "model/Cpu.hpp"

namespace tickwatch::app {

// Previous-sample store and the two-sample rate math built on it.
//
// Process baselines are keyed by pid/tid; CPU baselines live in a separate
// slot space where kAggregateCpu is the summary line and 0..n-1 are logical
// CPUs. Owned by the sampling thread, so nothing here is synchronised.
class RateCalculator {
public:
  static constexpr int kAggregateCpu = -1;

  // Percent of one core used by `id` since its previous observation, or
  // std::nullopt on first sight and for a non-positive interval. A counter
  // that went backwards (pid reuse, reset) counts as zero usage. The stored
  // baseline always becomes (timestamp, ticks).
  std::optional<double> observe(int32_t id, double timestamp, uint64_t ticks, long ticks_per_second);

  // 100 * work delta / total delta for one /proc/stat line; in [0, 100].
  std::optional<double> observe_cpu(int slot, const model::CpuTimes& now);

  // Drop every process baseline whose id is not in `seen`.
  void evict_stale(const std::unordered_set<int32_t>& seen);

  // Drop every per-CPU baseline whose index is not in `seen`; the aggregate
  // slot is kept.
  void evict_stale_cpus(const std::unordered_set<int>& seen);
  // Granularity switch: process and thread ids are different populations.
  void reset_processes() { procs_.clear(); }
  void forget_cpus() { cpus_.clear(); }

  size_t tracked_processes() const { return procs_.size(); }
  size_t tracked_cpus() const { return cpus_.size(); }
  bool has_baseline(int32_t id) const { return procs_.contains(id); }

private:
  struct Baseline {
    double timestamp{};
    uint64_t ticks{};
  };
  std::unordered_map<int32_t, Baseline> procs_;
  std::unordered_map<int, model::CpuTimes> cpus_;
};

} // namespace tickwatch::app
