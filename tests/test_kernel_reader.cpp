#include "minitest.hpp"
#include "proc_fixture.hpp"
#include "collectors/KernelReader.hpp"
#include <algorithm>

using namespace tickwatch::collectors;
using tickwatch::model::ProcessKind;

TEST(reader_lists_processes) {
  ProcFixture fx("reader_list");
  fx.task("1", 1, "init", 10, 5, 1, "/sbin/init");
  fx.task("2", 2, "kthreadd", 0, 0, 1, "");
  fx.write("self/stat", "not a pid dir\n");
  fx.write("meminfo", "MemTotal: 1 kB\n");
  KernelReader r(100, 4096);
  auto ids = r.list_process_ids(false);
  ASSERT_EQ(ids.size(), 2u);
  for (const auto& id : ids) {
    ASSERT_EQ(id.id, id.tgid);
    ASSERT_TRUE(!id.thread_level);
  }
}

TEST(reader_thread_mode_walks_task_dirs) {
  ProcFixture fx("reader_threads");
  fx.task("100", 100, "server", 300, 100, 2, "server --port 80");
  fx.task("100/task/100", 100, "server", 100, 50, 2, "server --port 80");
  fx.task("100/task/101", 101, "worker", 200, 50, 2, "server --port 80");
  KernelReader r(100, 4096);
  auto ids = r.list_process_ids(true);
  ASSERT_EQ(ids.size(), 2u);
  std::sort(ids.begin(), ids.end(), [](const TaskId& a, const TaskId& b){ return a.id < b.id; });
  ASSERT_EQ(ids[1].id, 101);
  ASSERT_EQ(ids[1].tgid, 100);

  // The leader's per-thread counters, not the process-wide ones
  auto leader = r.read_process_sample(ids[0]);
  ASSERT_TRUE(leader.has_value());
  ASSERT_EQ(leader->stat.utime, 100u);
  ASSERT_TRUE(leader->kind == ProcessKind::Task);
  auto worker = r.read_process_sample(ids[1]);
  ASSERT_TRUE(worker.has_value());
  ASSERT_EQ(worker->stat.comm, "worker");
  ASSERT_TRUE(worker->kind == ProcessKind::Thread);
}

TEST(reader_sample_fields_and_classification) {
  ProcFixture fx("reader_sample");
  fx.task("42", 42, "my (odd) name", 700, 300, 3, "python3 app.py");
  fx.task("2", 2, "kthreadd", 0, 0, 1, "");
  KernelReader r(100, 4096);
  auto p = r.read_process_sample(TaskId{42, 42, false});
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->stat.comm, "my (odd) name");
  ASSERT_EQ(p->cmdline, "python3 app.py");
  ASSERT_EQ(p->stat.utime + p->stat.stime, 1000u);
  ASSERT_EQ(p->stat.num_threads, 3);
  ASSERT_TRUE(p->uid.has_value());
  auto k = r.read_process_sample(TaskId{2, 2, false});
  ASSERT_TRUE(k.has_value());
  ASSERT_TRUE(k->kind == ProcessKind::KernelThread);
}

TEST(reader_vanished_process_is_skipped) {
  ProcFixture fx("reader_vanished");
  KernelReader r(100, 4096);
  ASSERT_TRUE(!r.read_process_sample(TaskId{999, 999, false}).has_value());
  fx.write("5/stat", "5 (half");
  ASSERT_TRUE(!r.read_process_sample(TaskId{5, 5, false}).has_value());
}

TEST(reader_system_files_report_status) {
  ProcFixture fx("reader_system");
  KernelReader r(100, 4096);
  double up = 0;
  ASSERT_TRUE(r.read_uptime(up) == ReadStatus::IoError);
  fx.write("uptime", "garbage\n");
  ASSERT_TRUE(r.read_uptime(up) == ReadStatus::ParseError);
  fx.uptime(123.5);
  ASSERT_TRUE(r.read_uptime(up) == ReadStatus::Ok);
  ASSERT_TRUE(up > 123.4 && up < 123.6);

  fx.standard_system_files();
  tickwatch::model::CpuTimesSet cpu;
  ASSERT_TRUE(r.read_system_cpu_times(cpu) == ReadStatus::Ok);
  ASSERT_EQ(cpu.per_core.size(), 2u);
  tickwatch::model::LoadAverage la;
  ASSERT_TRUE(r.read_load_average(la) == ReadStatus::Ok);
  MemoryTotals mt;
  ASSERT_TRUE(r.read_memory_totals(mt) == ReadStatus::Ok);
  ASSERT_EQ(mt.swap_free_kb, 1500000u);
  ASSERT_EQ(std::string(to_string(ReadStatus::ParseError)), "malformed");
}
