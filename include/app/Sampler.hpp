#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "app/Channel.hpp"
#include "app/Config.hpp"
#include "app/RateCalculator.hpp"
#include "collectors/KernelReader.hpp"
#include "model/Snapshot.hpp"

namespace tickwatch::app {

struct ControlMessage {
  bool show_threads{false};
};

using EventChannel = BoundedChannel<model::SamplerEvent>;
using ControlChannel = BoundedChannel<ControlMessage>;

// Consumer-side holder for the latest requested ControlMessage. A request
// that does not fit in the control channel stays pending and flush() retries
// it; a newer request replaces it.
class ControlOutbox {
public:
  explicit ControlOutbox(ControlChannel& control) : control_(control) {}

  void request(ControlMessage msg) { pending_ = msg; flush(); }
  // True once nothing is pending.
  bool flush() {
    if (pending_ && control_.try_send(*pending_)) pending_.reset();
    return !pending_;
  }
  bool pending() const { return pending_.has_value(); }

private:
  ControlChannel& control_;
  std::optional<ControlMessage> pending_;
};

enum class SamplerState { Idle, Sampling, Delivering, Sleeping, Stopped };

const char* to_string(SamplerState s);

// Background producer: one pass per interval, each delivered as a
// model::SamplerEvent on `events`. The loop ends when the consumer closes
// `events` or stop() is called; data errors never end it.
class Sampler {
public:
  Sampler(EventChannel& events, ControlChannel& control, SamplerSettings settings,
          collectors::KernelReader reader = collectors::KernelReader{});
  ~Sampler();
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  void start();
  void stop();
  SamplerState state() const { return state_.load(std::memory_order_acquire); }

  // The methods below touch the previous-sample store and must only be called
  // from the sampling thread, or before start() / after stop().

  // One complete pass, without delivery.
  model::SamplerEvent run_pass();
  // Returns true if the granularity changed (baselines were dropped).
  bool apply_control(const ControlMessage& msg);

  // Off while a full-screen UI owns the terminal; the same text still reaches
  // the consumer through Snapshot::status and PassError. Call before start().
  void set_stderr_logging(bool on) { log_stderr_ = on; }

  bool show_threads() const { return show_threads_; }
  const RateCalculator& calculator() const { return calc_; }

private:
  void run(std::stop_token st);
  // True if a control message changed the granularity while waiting.
  bool wait_for_next_pass(std::chrono::milliseconds wait, std::stop_token st);
  void log_once(const std::string& msg);

  EventChannel& events_;
  ControlChannel& control_;
  SamplerSettings settings_;
  collectors::KernelReader reader_;
  RateCalculator calc_{};
  bool show_threads_{false};
  uint64_t seq_{0};
  std::string last_logged_{};
  bool debug_{false};
  bool log_stderr_{true};
  std::atomic<SamplerState> state_{SamplerState::Idle};
  std::jthread thread_{};
};

} // namespace tickwatch::app
