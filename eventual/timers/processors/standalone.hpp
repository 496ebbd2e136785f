#pragma once

#include <eventual/timers/processor.hpp>
#include <eventual/timers/queue.hpp>

#include <eventual/timers/processors/launch_settings.hpp>

#include <eventual/satellite/logger.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/stdlike/thread.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace eventual::timers {

// Takes up one thread to process timers
// Timers still pending at destruction are dropped without firing

class StandaloneProcessor : public IProcessor {
 public:
  using Logger = satellite::Logger<kCollectMetrics, /*AtomicMetrics=*/true>;

  StandaloneProcessor();

  // Pinned
  StandaloneProcessor(const StandaloneProcessor&) = delete;
  StandaloneProcessor& operator=(const StandaloneProcessor&) = delete;

  StandaloneProcessor(StandaloneProcessor&&) = delete;
  StandaloneProcessor& operator=(StandaloneProcessor&&) = delete;

  ~StandaloneProcessor() override;

  // IProcessor
  void AddTimer(std::shared_ptr<TimerBase> timer) override;

  Logger::Metrics Metrics() const {
    return logger_.GatherMetrics();
  }

 private:
  void WorkerLoop();

  // nullopt if the queue was depleted
  std::optional<TimerBase::Clock::duration> PollQueue();

  void WakeWorker();

  void DropAll();

  void Stop();

 private:
  twist::ed::stdlike::atomic<bool> stop_requested_{false};
  twist::ed::stdlike::atomic<uint32_t> wakeups_{0};

  TimersQueue queue_{};

  Logger logger_;
  Logger::LoggerShard* metrics_;

  // NB: Worker created last to have every
  // other constructor in hb with it
  twist::ed::stdlike::thread worker_;
};

}  // namespace eventual::timers
