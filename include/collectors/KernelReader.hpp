#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "collectors/ProcParsers.hpp"
#include "model/Snapshot.hpp"

namespace tickwatch::collectors {

enum class ReadStatus { Ok, IoError, ParseError };

const char* to_string(ReadStatus s);

struct TaskId {
  int32_t id{};   // pid, or tid in thread mode
  int32_t tgid{}; // owning process
  // Read from /proc/<tgid>/task/<id>: per-thread counters even for the leader
  bool thread_level{false};
};

// One entity's raw counters and metadata at a point in time.
struct RawProcess {
  TaskId task{};
  StatFields stat{};
  std::string cmdline;
  std::optional<uint32_t> uid;
  model::ProcessKind kind{model::ProcessKind::Task};
};

// Stateless reader over /proc. Every path is remapped through util::map_proc_path.
class KernelReader {
public:
  KernelReader();
  KernelReader(long ticks_per_second, long page_size);

  long ticks_per_second() const { return ticks_per_second_; }
  long page_size() const { return page_size_; }

  // Best-effort enumeration; processes that vanish mid-scan are skipped.
  [[nodiscard]] std::vector<TaskId> list_process_ids(bool threads) const;

  // std::nullopt when the entity exited between enumeration and read.
  [[nodiscard]] std::optional<RawProcess> read_process_sample(const TaskId& task) const;

  [[nodiscard]] ReadStatus read_system_cpu_times(model::CpuTimesSet& out) const;
  [[nodiscard]] ReadStatus read_uptime(double& out) const;
  [[nodiscard]] ReadStatus read_load_average(model::LoadAverage& out) const;
  [[nodiscard]] ReadStatus read_memory_totals(MemoryTotals& out) const;

private:
  long ticks_per_second_{100};
  long page_size_{4096};
};

} // namespace tickwatch::collectors
