#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <cstdint>

namespace eventual::threads::blocking {

// One-shot event

class Event {
  enum State : uint32_t { NotReady = 0, Ready = 1 };

 public:
  void Wait() {
    while (ready_.load(std::memory_order::acquire) == State::NotReady) {
      twist::ed::futex::Wait(ready_, State::NotReady,
                             std::memory_order::acquire);
    }
  }

  void Set() {
    auto wake_key = twist::ed::futex::PrepareWake(ready_);
    ready_.store(State::Ready, std::memory_order::release);
    twist::ed::futex::WakeAll(wake_key);
  }

 private:
  twist::ed::stdlike::atomic<uint32_t> ready_{State::NotReady};
};

}  // namespace eventual::threads::blocking
