#pragma once

#include <eventual/futures/detail/timeout_block.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/syntax/pipe.hpp>

#include <eventual/result/errors/timeout.hpp>
#include <eventual/result/make/err.hpp>

#include <eventual/satellite/satellite.hpp>

#include <eventual/timers/delay.hpp>
#include <eventual/timers/processor.hpp>
#include <eventual/timers/submit_after.hpp>

#include <wheels/core/assert.hpp>

#include <memory>

namespace eventual::futures {

namespace pipe {

struct [[nodiscard]] WithTimeout {
  timers::Delay delay;
  executors::IExecutor* executor;

  template <SomeFuture InputFuture>
  Future<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    auto [bounded, promise] = Contract<T>(*executor);

    auto block = std::make_shared<detail::TimeoutBlock<T>>(promise);
    auto deadline = TimeoutError::Clock::now() + delay.time_;

    auto timer = timers::SubmitAfter(delay, *executor, [block, deadline] {
      if (auto p = block->TryTake()) {
        // Late source results find the block empty
        p->SetError(TimeoutError(deadline));
      }
    });

    f.Respond([block, timer](const Try<T>& result) mutable {
      if (auto p = block->TryTake()) {
        timer.Cancel();
        p->Set(result);
      }
    });

    return bounded;
  }
};

}  // namespace pipe

/*
 * Usage:
 *
 * auto f = futures::Submit(pool, [] {
 *   return SlowComputation();
 * }) | futures::WithTimeout(proc.DelayFromThis(100ms), pool);
 *
 * Expired future fails with TimeoutError, the source keeps running
 *
 */

// Future<T> -> Delay -> Future<T>

inline auto WithTimeout(timers::Delay delay, executors::IExecutor& exe) {
  return pipe::WithTimeout{delay, &exe};
}

inline auto WithTimeout(timers::Millis delay, executors::IExecutor& exe) {
  auto* global_proc = satellite::GetProcessor();

  WHEELS_VERIFY(global_proc != nullptr,
                "Use satellite::MakeVisible before calling this overload!");

  return pipe::WithTimeout{global_proc->DelayFromThis(delay), &exe};
}

}  // namespace eventual::futures
