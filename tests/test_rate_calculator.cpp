#include "minitest.hpp"
#include "app/RateCalculator.hpp"
#include <cmath>

using tickwatch::app::RateCalculator;
using tickwatch::model::CpuTimes;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

TEST(rate_first_observation_is_unknown) {
  RateCalculator rc;
  ASSERT_TRUE(!rc.observe(100, 10.0, 500, 100).has_value());
  ASSERT_TRUE(rc.has_baseline(100));
}

TEST(rate_one_full_core) {
  RateCalculator rc;
  (void)rc.observe(100, 10.0, 500, 100);
  auto pct = rc.observe(100, 12.0, 700, 100);
  ASSERT_TRUE(pct.has_value());
  ASSERT_TRUE(near(*pct, 100.0));
}

TEST(rate_can_exceed_one_core) {
  RateCalculator rc;
  (void)rc.observe(7, 1.0, 0, 100);
  auto pct = rc.observe(7, 2.0, 250, 100);
  ASSERT_TRUE(pct.has_value());
  ASSERT_TRUE(near(*pct, 250.0));
}

TEST(rate_counter_reset_reads_zero) {
  RateCalculator rc;
  (void)rc.observe(42, 10.0, 900, 100);
  auto pct = rc.observe(42, 11.0, 100, 100);
  ASSERT_TRUE(pct.has_value());
  ASSERT_TRUE(near(*pct, 0.0));
  // The lower counter is the new baseline
  auto next = rc.observe(42, 12.0, 150, 100);
  ASSERT_TRUE(next.has_value());
  ASSERT_TRUE(near(*next, 50.0));
}

TEST(rate_zero_interval_is_unknown) {
  RateCalculator rc;
  (void)rc.observe(5, 10.0, 100, 100);
  ASSERT_TRUE(!rc.observe(5, 10.0, 200, 100).has_value());
  // Clock went backwards
  ASSERT_TRUE(!rc.observe(5, 9.0, 300, 100).has_value());
  ASSERT_TRUE(!rc.observe(6, 1.0, 0, 0).has_value());
  ASSERT_TRUE(!rc.observe(6, 2.0, 10, 0).has_value());
}

TEST(rate_evict_stale_keeps_seen_only) {
  RateCalculator rc;
  (void)rc.observe(1, 1.0, 0, 100);
  (void)rc.observe(2, 1.0, 0, 100);
  (void)rc.observe(3, 1.0, 0, 100);
  rc.evict_stale({1, 3});
  ASSERT_EQ(rc.tracked_processes(), 2u);
  ASSERT_TRUE(!rc.has_baseline(2));
  rc.evict_stale({1, 3});
  ASSERT_EQ(rc.tracked_processes(), 2u);
  // An evicted id that reappears starts over
  ASSERT_TRUE(!rc.observe(2, 2.0, 50, 100).has_value());
}

TEST(rate_reset_processes_forgets_everything) {
  RateCalculator rc;
  (void)rc.observe(1, 1.0, 0, 100);
  (void)rc.observe(2, 1.0, 0, 100);
  rc.reset_processes();
  ASSERT_EQ(rc.tracked_processes(), 0u);
  ASSERT_TRUE(!rc.observe(1, 2.0, 100, 100).has_value());
}

TEST(rate_aggregate_cpu_quarter_busy) {
  RateCalculator rc;
  CpuTimes a{}; a.user = 1000; a.idle = 9000;
  CpuTimes b{}; b.user = 1100; b.idle = 9300;
  ASSERT_TRUE(!rc.observe_cpu(RateCalculator::kAggregateCpu, a).has_value());
  auto pct = rc.observe_cpu(RateCalculator::kAggregateCpu, b);
  ASSERT_TRUE(pct.has_value());
  ASSERT_TRUE(near(*pct, 25.0));
}

TEST(rate_cpu_without_progress_is_unknown) {
  RateCalculator rc;
  CpuTimes a{}; a.user = 10; a.idle = 90;
  (void)rc.observe_cpu(0, a);
  ASSERT_TRUE(!rc.observe_cpu(0, a).has_value());
  CpuTimes back{}; back.user = 5; back.idle = 50;
  ASSERT_TRUE(!rc.observe_cpu(0, back).has_value());
}

TEST(rate_cpu_slots_are_independent) {
  RateCalculator rc;
  CpuTimes a{}; a.user = 0; a.idle = 100;
  CpuTimes busy{}; busy.user = 100; busy.idle = 100;
  (void)rc.observe_cpu(0, a);
  (void)rc.observe_cpu(1, a);
  auto p0 = rc.observe_cpu(0, busy);
  auto p1 = rc.observe_cpu(1, a);
  ASSERT_TRUE(p0.has_value());
  ASSERT_TRUE(near(*p0, 100.0));
  ASSERT_TRUE(!p1.has_value());
  // Process resets leave CPU baselines alone
  rc.reset_processes();
  CpuTimes more = busy; more.idle = 200;
  auto again = rc.observe_cpu(0, more);
  ASSERT_TRUE(again.has_value());
  ASSERT_TRUE(near(*again, 0.0));
}

TEST(rate_evict_stale_cpus_keeps_aggregate) {
  RateCalculator rc;
  CpuTimes a{}; a.user = 10; a.idle = 10;
  (void)rc.observe_cpu(RateCalculator::kAggregateCpu, a);
  (void)rc.observe_cpu(0, a);
  (void)rc.observe_cpu(1, a);
  rc.evict_stale_cpus({0});
  ASSERT_EQ(rc.tracked_cpus(), 2u);
  // cpu1 starts over when it reappears
  CpuTimes b{}; b.user = 20; b.idle = 20;
  ASSERT_TRUE(!rc.observe_cpu(1, b).has_value());
  ASSERT_TRUE(rc.observe_cpu(RateCalculator::kAggregateCpu, b).has_value());
}
