#pragma once

#include <eventual/executors/executor.hpp>
#include <eventual/executors/submit.hpp>

#include <eventual/timers/delay.hpp>
#include <eventual/timers/handle.hpp>
#include <eventual/timers/processor.hpp>

#include <memory>
#include <utility>

namespace eventual::timers {

namespace detail {

template <typename F>
class SubmitTimer final : public TimerBase {
 public:
  SubmitTimer(Millis delay, executors::IExecutor& exe, F fun)
      : TimerBase(delay),
        executor_(exe),
        fun_(std::move(fun)) {
  }

  void Fire() noexcept override {
    executors::Submit(executor_, std::move(fun_));
  }

 private:
  executors::IExecutor& executor_;
  F fun_;
};

}  // namespace detail

/*
 * Usage:
 *
 * auto handle = timers::SubmitAfter(proc.DelayFromThis(100ms), pool, [] {
 *   fmt::println("100ms later, on the pool");
 * });
 *
 * handle.Cancel();
 *
 */

template <typename F>
Handle SubmitAfter(Delay delay, executors::IExecutor& exe, F fun) {
  auto timer = std::make_shared<detail::SubmitTimer<F>>(delay.time_, exe,
                                                        std::move(fun));
  Handle handle{timer};

  delay.processor_->AddTimer(std::move(timer));

  return handle;
}

}  // namespace eventual::timers
