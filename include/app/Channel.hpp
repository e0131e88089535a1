#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace tickwatch::app {

// Bounded FIFO handed between exactly one producer thread and one consumer.
// Either side may close(); afterwards send() fails and receivers drain what
// is left, then see std::nullopt.
template <typename T>
class BoundedChannel {
public:
  explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}
  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // Blocks while full. Returns false if the channel is (or becomes) closed,
  // or if `st` is stopped while waiting; the value is dropped in both cases.
  bool send(T value, std::stop_token st = {}) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, st, [&] { return closed_ || queue_.size() < capacity_; });
    if (closed_ || st.stop_requested()) return false;
    queue_.push_back(std::move(value));
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Non-blocking send used by the consumer side for control messages.
  bool try_send(T value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_ || queue_.size() >= capacity_) return false;
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // Blocks until a value arrives or the channel is closed and drained.
  std::optional<T> recv(std::stop_token st = {}) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, st, [&] { return closed_ || !queue_.empty(); });
    return pop_locked(lk);
  }

  // As recv(), but gives up after `timeout`.
  template <typename Rep, typename Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout, std::stop_token st = {}) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait_for(lk, st, timeout, [&] { return closed_ || !queue_.empty(); });
    return pop_locked(lk);
  }

  std::optional<T> try_recv() {
    std::unique_lock<std::mutex> lk(mu_);
    return pop_locked(lk);
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  std::optional<T> pop_locked(std::unique_lock<std::mutex>& lk) {
    if (queue_.empty()) return std::nullopt;
    std::optional<T> out(std::move(queue_.front()));
    queue_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return out;
  }

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable_any not_full_;
  std::condition_variable_any not_empty_;
  std::deque<T> queue_;
  bool closed_{false};
};

} // namespace tickwatch::app
