#include "app/Sampler.hpp"

#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <unordered_set>
#include <vector>

using namespace std::chrono;

namespace tickwatch::app {

const char* to_string(SamplerState s) {
  switch (s) {
    case SamplerState::Idle: return "idle";
    case SamplerState::Sampling: return "sampling";
    case SamplerState::Delivering: return "delivering";
    case SamplerState::Sleeping: return "sleeping";
    case SamplerState::Stopped: return "stopped";
  }
  return "?";
}

static void append_note(std::string& status, const char* what, collectors::ReadStatus rs) {
  if (!status.empty()) status += "; ";
  status += what;
  status += ": ";
  status += collectors::to_string(rs);
}

Sampler::Sampler(EventChannel& events, ControlChannel& control, SamplerSettings settings,
                 collectors::KernelReader reader)
  : events_(events), control_(control), settings_(settings), reader_(reader),
    show_threads_(settings.show_threads), debug_(env_flag("TICKWATCH_DEBUG", false)) {}

Sampler::~Sampler() { stop(); }

void Sampler::start() {
  if (thread_.joinable()) return;
  state_.store(SamplerState::Idle, std::memory_order_release);
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

bool Sampler::apply_control(const ControlMessage& msg) {
  if (msg.show_threads == show_threads_) return false;
  show_threads_ = msg.show_threads;
  calc_.reset_processes();
  return true;
}

model::SamplerEvent Sampler::run_pass() {
  const uint64_t seq = ++seq_;

  double uptime = 0.0;
  if (auto rs = reader_.read_uptime(uptime); rs != collectors::ReadStatus::Ok) {
    return model::PassError{seq, std::string("uptime: ") + collectors::to_string(rs)};
  }

  model::Snapshot s;
  s.seq = seq;
  s.uptime_s = uptime;
  s.show_threads = show_threads_;

  const long tps = reader_.ticks_per_second();
  const uint64_t page = static_cast<uint64_t>(reader_.page_size());
  auto ids = reader_.list_process_ids(show_threads_);
  std::unordered_set<int32_t> seen;
  seen.reserve(ids.size());
  s.processes.reserve(ids.size());

  for (const auto& id : ids) {
    auto rp = reader_.read_process_sample(id);
    if (!rp) { ++s.skipped; continue; }
    model::ProcSample ps;
    ps.pid = id.id;
    ps.tgid = id.tgid;
    ps.name = std::move(rp->stat.comm);
    ps.state = rp->stat.state;
    ps.total_time = rp->stat.utime + rp->stat.stime;
    ps.rss_bytes = (rp->stat.rss_pages > 0) ? static_cast<uint64_t>(rp->stat.rss_pages) * page : 0;
    ps.vsize_bytes = rp->stat.vsize_bytes;
    ps.uid = rp->uid;
    ps.num_threads = (rp->stat.num_threads > 0) ? static_cast<uint32_t>(rp->stat.num_threads) : 1;
    ps.cmd = std::move(rp->cmdline);
    ps.kind = rp->kind;
    ps.cpu_pct = calc_.observe(id.id, uptime, ps.total_time, tps);
    seen.insert(id.id);

    switch (ps.kind) {
      case model::ProcessKind::Task: s.counts.tasks++; break;
      case model::ProcessKind::KernelThread: s.counts.kernel_threads++; break;
      case model::ProcessKind::Thread: s.counts.thread_records++; break;
    }
    if (id.id == id.tgid) s.counts.threads += ps.num_threads - 1;
    s.processes.push_back(std::move(ps));
  }
  calc_.evict_stale(seen);

  model::CpuTimesSet times;
  if (auto rs = reader_.read_system_cpu_times(times); rs == collectors::ReadStatus::Ok) {
    s.cpu.usage_pct = calc_.observe_cpu(RateCalculator::kAggregateCpu, times.total);
    std::unordered_set<int> online;
    s.cpu.per_core.reserve(times.per_core.size());
    for (const auto& core : times.per_core) {
      s.cpu.per_core.push_back(model::CoreUsage{core.index, calc_.observe_cpu(core.index, core.times)});
      online.insert(core.index);
    }
    // A CPU that comes back online starts over
    calc_.evict_stale_cpus(online);
    s.cpu.logical_threads = static_cast<int>(times.per_core.size());
    s.cpu.times = std::move(times);
  } else {
    append_note(s.status, "cpu", rs);
  }

  if (auto rs = reader_.read_load_average(s.load); rs != collectors::ReadStatus::Ok) {
    s.load = model::LoadAverage{};
    append_note(s.status, "loadavg", rs);
  }

  collectors::MemoryTotals mt;
  if (auto rs = reader_.read_memory_totals(mt); rs == collectors::ReadStatus::Ok) {
    s.mem.total_kb = mt.mem_total_kb;
    s.mem.free_kb = mt.mem_free_kb;
    s.mem.used_kb = (mt.mem_total_kb > mt.mem_free_kb) ? (mt.mem_total_kb - mt.mem_free_kb) : 0;
    s.mem.swap_total_kb = mt.swap_total_kb;
    s.mem.swap_free_kb = mt.swap_free_kb;
    s.mem.swap_used_kb = (mt.swap_total_kb > mt.swap_free_kb) ? (mt.swap_total_kb - mt.swap_free_kb) : 0;
    s.mem.used_pct = (s.mem.total_kb > 0)
      ? (100.0 * static_cast<double>(s.mem.used_kb) / static_cast<double>(s.mem.total_kb)) : 0.0;
  } else {
    append_note(s.status, "meminfo", rs);
  }
  return s;
}

void Sampler::log_once(const std::string& msg) {
  if (msg == last_logged_) return;
  last_logged_ = msg;
  if (log_stderr_ && !msg.empty()) std::fprintf(stderr, "tickwatch: sampler: %s\n", msg.c_str());
}

bool Sampler::wait_for_next_pass(milliseconds wait, std::stop_token st) {
  auto deadline = steady_clock::now() + wait;
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= deadline) return false;
    if (control_.closed() && control_.size() == 0) {
      // No one can toggle any more: plain interruptible sleep
      std::mutex m;
      std::condition_variable_any cv;
      std::unique_lock<std::mutex> lk(m);
      cv.wait_until(lk, st, deadline, []{ return false; });
      return false;
    }
    auto msg = control_.recv_for(duration_cast<milliseconds>(deadline - now), st);
    // A granularity change invalidates the current view: sample right away
    if (msg && apply_control(*msg)) return true;
  }
  return false;
}

void Sampler::run(std::stop_token st) {
  bool first = true;
  while (!st.stop_requested()) {
    state_.store(SamplerState::Sampling, std::memory_order_release);
    while (auto msg = control_.try_recv()) (void)apply_control(*msg);
    auto ev = run_pass();
    if (const auto* err = std::get_if<model::PassError>(&ev)) {
      log_once(err->message);
    } else {
      const auto& snap = std::get<model::Snapshot>(ev);
      log_once(snap.status);
      if (debug_ && log_stderr_) {
        std::fprintf(stderr, "tickwatch: sampler: pass %llu: %zu entries, %zu skipped, %zu baselines\n",
                     static_cast<unsigned long long>(snap.seq), snap.processes.size(), snap.skipped,
                     calc_.tracked_processes());
      }
    }

    state_.store(SamplerState::Delivering, std::memory_order_release);
    if (!events_.send(std::move(ev), st)) break; // consumer went away

    state_.store(SamplerState::Sleeping, std::memory_order_release);
    // Warm-up: the pass after a fresh baseline follows it after warmup_ms
    auto wait = milliseconds(first ? settings_.warmup_ms : settings_.interval_ms);
    first = wait_for_next_pass(wait, st);
  }
  calc_.reset_processes();
  calc_.forget_cpus();
  state_.store(SamplerState::Stopped, std::memory_order_release);
}

} // namespace tickwatch::app
