#include "model/Process.hpp"

namespace tickwatch::model {

ProcessKind classify_process(int32_t id, int32_t tgid, const std::string& cmdline) {
  // Kernel threads expose an empty cmdline; so do zombies, which top reports the same way.
  if (cmdline.empty()) return ProcessKind::KernelThread;
  if (id == tgid) return ProcessKind::Task;
  return ProcessKind::Thread;
}

const char* to_string(ProcessKind kind) {
  switch (kind) {
    case ProcessKind::Task: return "task";
    case ProcessKind::Thread: return "thread";
    case ProcessKind::KernelThread: return "kthread";
  }
  return "?";
}

} // namespace tickwatch::model
