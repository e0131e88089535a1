#include "collectors/KernelReader.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>
#include <charconv>

namespace tickwatch::collectors {

const char* to_string(ReadStatus s) {
  switch (s) {
    case ReadStatus::Ok: return "ok";
    case ReadStatus::IoError: return "unreadable";
    case ReadStatus::ParseError: return "malformed";
  }
  return "?";
}

static int32_t to_pid(const std::string& name) {
  int32_t v = 0;
  std::from_chars(name.data(), name.data() + name.size(), v);
  return v;
}

KernelReader::KernelReader() {
  long hz = ::sysconf(_SC_CLK_TCK);
  long pg = ::sysconf(_SC_PAGESIZE);
  ticks_per_second_ = (hz > 0) ? hz : 100; // USER_HZ is 100 on every mainstream arch
  page_size_ = (pg > 0) ? pg : 4096;
}

KernelReader::KernelReader(long ticks_per_second, long page_size)
  : ticks_per_second_(ticks_per_second), page_size_(page_size) {}

std::vector<TaskId> KernelReader::list_process_ids(bool threads) const {
  std::vector<TaskId> out;
  auto entries = util::list_dir("/proc");
  if (!entries) return out;
  out.reserve(entries->size());
  for (const auto& name : *entries) {
    if (!util::is_numeric_name(name)) continue;
    int32_t pid = to_pid(name);
    if (!threads) {
      out.push_back(TaskId{pid, pid, false});
      continue;
    }
    auto tasks = util::list_dir("/proc/" + name + "/task");
    if (!tasks) continue; // exited after the /proc scan
    for (const auto& tname : *tasks) {
      if (!util::is_numeric_name(tname)) continue;
      out.push_back(TaskId{to_pid(tname), pid, true});
    }
  }
  return out;
}

std::optional<RawProcess> KernelReader::read_process_sample(const TaskId& task) const {
  std::string dir = "/proc/" + std::to_string(task.tgid);
  if (task.thread_level) dir += "/task/" + std::to_string(task.id);

  auto content = util::read_file_string(dir + "/stat");
  if (!content) return std::nullopt;
  RawProcess rp;
  rp.task = task;
  if (!parse_stat(*content, rp.stat)) return std::nullopt;

  // An unreadable cmdline is treated like an empty one
  if (auto bytes = util::read_file_bytes(dir + "/cmdline")) rp.cmdline = parse_cmdline(*bytes);
  rp.uid = util::path_owner(dir);
  rp.kind = model::classify_process(task.id, task.tgid, rp.cmdline);
  return rp;
}

ReadStatus KernelReader::read_system_cpu_times(model::CpuTimesSet& out) const {
  auto txt = util::read_file_string("/proc/stat");
  if (!txt) return ReadStatus::IoError;
  return parse_cpu_times(*txt, out) ? ReadStatus::Ok : ReadStatus::ParseError;
}

ReadStatus KernelReader::read_uptime(double& out) const {
  auto txt = util::read_file_string("/proc/uptime");
  if (!txt) return ReadStatus::IoError;
  return parse_uptime(*txt, out) ? ReadStatus::Ok : ReadStatus::ParseError;
}

ReadStatus KernelReader::read_load_average(model::LoadAverage& out) const {
  auto txt = util::read_file_string("/proc/loadavg");
  if (!txt) return ReadStatus::IoError;
  return parse_loadavg(*txt, out) ? ReadStatus::Ok : ReadStatus::ParseError;
}

ReadStatus KernelReader::read_memory_totals(MemoryTotals& out) const {
  auto txt = util::read_file_string("/proc/meminfo");
  if (!txt) return ReadStatus::IoError;
  return parse_meminfo(*txt, out) ? ReadStatus::Ok : ReadStatus::ParseError;
}

} // namespace tickwatch::collectors
