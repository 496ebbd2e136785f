#pragma once

#include <eventual/timers/delay.hpp>
#include <eventual/timers/timer.hpp>

#include <eventual/satellite/satellite.hpp>

#include <memory>

namespace eventual::timers {

struct IProcessor {
  virtual ~IProcessor() = default;

  virtual void AddTimer(std::shared_ptr<TimerBase> timer) = 0;

  Delay DelayFromThis(Millis ms) {
    return Delay{ms, *this};
  }

  // Allow WithTimeout to deduce processor automatically
  void MakeGlobal() {
    satellite::MakeVisible(this);
  }
};

}  // namespace eventual::timers
