#pragma once

#include <eventual/timers/millis.hpp>

#include <twist/ed/stdlike/atomic.hpp>

#include <chrono>
#include <cstdint>

namespace eventual::timers {

struct ITimer {
  virtual ~ITimer() = default;

  // Called by the processor at most once, after the deadline
  virtual void Fire() noexcept = 0;
};

// Pending -> Fired | Cancelled, decided by a single CAS

class TimerBase : public ITimer {
 public:
  using Clock = std::chrono::steady_clock;

  explicit TimerBase(Millis delay)
      : deadline_(Clock::now() + delay) {
  }

  Clock::time_point Deadline() const {
    return deadline_;
  }

  // true iff the timer will never fire
  bool TryCancel() {
    return Transit(State::Cancelled);
  }

  // true iff the caller must Fire the timer
  bool TryClaim() {
    return Transit(State::Fired);
  }

  bool IsCancelled() const {
    return state_.load(std::memory_order::acquire) == State::Cancelled;
  }

 private:
  enum State : uint32_t { Pending = 0, Fired = 1, Cancelled = 2 };

  bool Transit(State target) {
    uint32_t expected = State::Pending;
    return state_.compare_exchange_strong(expected, target,
                                          std::memory_order::acq_rel,
                                          std::memory_order::acquire);
  }

 private:
  const Clock::time_point deadline_;
  twist::ed::stdlike::atomic<uint32_t> state_{State::Pending};
};

}  // namespace eventual::timers
