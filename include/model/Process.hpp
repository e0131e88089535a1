#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tickwatch::model {

enum class ProcessKind {
  Task,         // thread-group leader with a command line
  Thread,       // non-leader thread of a task
  KernelThread  // no discoverable command line
};

// Single source of truth for ProcessKind. tgid is the identity the entry was
// enumerated under (equal to id outside thread mode).
ProcessKind classify_process(int32_t id, int32_t tgid, const std::string& cmdline);

const char* to_string(ProcessKind kind);

struct ProcSample {
  int32_t pid{};        // pid, or tid in thread mode
  int32_t tgid{};
  std::string name;     // comm
  char state{'?'};
  uint64_t total_time{}; // utime+stime, jiffies
  uint64_t rss_bytes{};
  uint64_t vsize_bytes{};
  std::optional<uint32_t> uid;
  uint32_t num_threads{1};
  std::string cmd;
  ProcessKind kind{ProcessKind::Task};
  // Percent of one core since the previous pass; unset on first sight.
  std::optional<double> cpu_pct;
};

struct TaskCounts {
  size_t tasks{};
  size_t kernel_threads{};
  size_t thread_records{}; // entries classified as Thread (thread mode only)
  size_t threads{};        // sum of num_threads-1 over group leaders
};

} // namespace tickwatch::model
