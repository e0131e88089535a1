#include "minitest.hpp"
#include "app/Channel.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using tickwatch::app::BoundedChannel;
using namespace std::chrono_literals;

TEST(channel_fifo_order) {
  BoundedChannel<int> ch(4);
  ASSERT_TRUE(ch.send(1));
  ASSERT_TRUE(ch.send(2));
  ASSERT_TRUE(ch.try_send(3));
  ASSERT_EQ(ch.recv().value(), 1);
  ASSERT_EQ(ch.recv().value(), 2);
  ASSERT_EQ(ch.try_recv().value(), 3);
  ASSERT_TRUE(!ch.try_recv().has_value());
}

TEST(channel_capacity_blocks_sender) {
  BoundedChannel<int> ch(1);
  ASSERT_EQ(ch.capacity(), 1u);
  ASSERT_TRUE(ch.send(1));
  ASSERT_TRUE(!ch.try_send(2));
  std::atomic<bool> sent{false};
  std::thread t([&]{ sent.store(ch.send(2)); });
  std::this_thread::sleep_for(50ms);
  ASSERT_TRUE(!sent.load());
  ASSERT_EQ(ch.recv().value(), 1);
  t.join();
  ASSERT_TRUE(sent.load());
  ASSERT_EQ(ch.recv().value(), 2);
}

TEST(channel_close_wakes_blocked_sender) {
  BoundedChannel<int> ch(1);
  ASSERT_TRUE(ch.send(1));
  std::atomic<int> result{-1};
  std::thread t([&]{ result.store(ch.send(2) ? 1 : 0); });
  std::this_thread::sleep_for(20ms);
  ch.close();
  t.join();
  ASSERT_EQ(result.load(), 0);
  // Already-queued values drain after close
  ASSERT_EQ(ch.recv().value(), 1);
  ASSERT_TRUE(!ch.recv().has_value());
  ASSERT_TRUE(!ch.send(3));
}

TEST(channel_close_wakes_blocked_receiver) {
  BoundedChannel<int> ch(2);
  std::atomic<bool> got_value{true};
  std::thread t([&]{ got_value.store(ch.recv().has_value()); });
  std::this_thread::sleep_for(20ms);
  ch.close();
  t.join();
  ASSERT_TRUE(!got_value.load());
  ASSERT_TRUE(ch.closed());
}

TEST(channel_recv_for_times_out) {
  BoundedChannel<int> ch(2);
  auto t0 = std::chrono::steady_clock::now();
  ASSERT_TRUE(!ch.recv_for(30ms).has_value());
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 >= 25ms);
}

TEST(channel_stop_token_interrupts_send) {
  BoundedChannel<int> ch(1);
  ASSERT_TRUE(ch.send(1));
  std::stop_source src;
  std::atomic<int> result{-1};
  std::thread t([&]{ result.store(ch.send(2, src.get_token()) ? 1 : 0); });
  std::this_thread::sleep_for(20ms);
  src.request_stop();
  t.join();
  ASSERT_EQ(result.load(), 0);
  ASSERT_EQ(ch.size(), 1u);
}
