#include "app/RateCalculator.hpp"

namespace tickwatch::app {

std::optional<double> RateCalculator::observe(int32_t id, double timestamp, uint64_t ticks, long ticks_per_second) {
  auto [it, inserted] = procs_.try_emplace(id, Baseline{timestamp, ticks});
  if (inserted) return std::nullopt;

  Baseline prev = it->second;
  it->second = Baseline{timestamp, ticks};

  double elapsed = (timestamp - prev.timestamp) * static_cast<double>(ticks_per_second);
  if (!(elapsed > 0.0)) return std::nullopt;
  uint64_t used = (ticks > prev.ticks) ? (ticks - prev.ticks) : 0;
  return 100.0 * static_cast<double>(used) / elapsed;
}

std::optional<double> RateCalculator::observe_cpu(int slot, const model::CpuTimes& now) {
  auto [it, inserted] = cpus_.try_emplace(slot, now);
  if (inserted) return std::nullopt;

  model::CpuTimes prev = it->second;
  it->second = now;

  uint64_t t_now = now.total(), t_prev = prev.total();
  if (t_now <= t_prev) return std::nullopt;
  uint64_t td = t_now - t_prev;
  uint64_t w_now = now.work(), w_prev = prev.work();
  uint64_t wd = (w_now > w_prev) ? (w_now - w_prev) : 0;
  if (wd > td) wd = td;
  return 100.0 * static_cast<double>(wd) / static_cast<double>(td);
}

void RateCalculator::evict_stale(const std::unordered_set<int32_t>& seen) {
  std::erase_if(procs_, [&](const auto& kv) { return !seen.contains(kv.first); });
}

void RateCalculator::evict_stale_cpus(const std::unordered_set<int>& seen) {
  std::erase_if(cpus_, [&](const auto& kv) {
    return kv.first != kAggregateCpu && !seen.contains(kv.first);
  });
}

} // namespace tickwatch::app
