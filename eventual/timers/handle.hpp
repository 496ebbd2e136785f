#pragma once

#include <eventual/timers/timer.hpp>

#include <memory>

namespace eventual::timers {

// Doesn't keep the timer alive

class Handle {
 public:
  Handle() = default;

  explicit Handle(std::weak_ptr<TimerBase> timer)
      : timer_(std::move(timer)) {
  }

  // true iff the timer was still pending and now never fires
  bool Cancel() {
    if (auto timer = timer_.lock()) {
      return timer->TryCancel();
    }
    return false;
  }

 private:
  std::weak_ptr<TimerBase> timer_{};
};

}  // namespace eventual::timers
