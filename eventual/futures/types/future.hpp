#pragma once

#include <eventual/futures/detail/shared_state.hpp>
#include <eventual/futures/types/promise.hpp>

#include <eventual/executors/executor.hpp>
#include <eventual/executors/submit.hpp>

#include <eventual/result/make/err.hpp>
#include <eventual/result/types/error.hpp>
#include <eventual/result/types/try.hpp>

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

namespace eventual::futures {

/*
 * Eager single-assignment result bound to an executor
 *
 * Usage:
 *
 * futures::Future<int> f(pool, [](futures::Promise<int> p) {
 *   p.SetValue(42);
 * });
 *
 * f.Respond([](const Try<int>& result) {
 *   fmt::println("{}", *result);
 * });
 *
 */

template <typename T>
class Future {
  using State = detail::SharedState<T>;

 public:
  using ValueType = T;

  // Submits producer to exe right away
  template <typename Producer>
  requires std::invocable<Producer&, Promise<T>>
  Future(executors::IExecutor& exe, Producer producer)
      : state_(std::make_shared<State>(exe)) {
    Promise<T> promise(state_);

    executors::Submit(exe, [producer = std::move(producer),
                            promise = std::move(promise)]() mutable {
      try {
        producer(promise);
      } catch (const std::exception&) {
        promise.SetError(Error::FromCurrentException());
      }
    });
  }

  // Completed only through promises made from the same state
  explicit Future(std::shared_ptr<State> state)
      : state_(std::move(state)) {
  }

  // Runs fun(const Try<T>&) on the bound executor exactly once
  template <typename F>
  Future Respond(F fun) const {
    state_->Subscribe(std::move(fun));
    return *this;
  }

  bool IsReady() const {
    return state_->IsReady();
  }

  // Non-blocking snapshot
  std::optional<Try<T>> Peek() const {
    return state_->Peek();
  }

  executors::IExecutor& Executor() const {
    return state_->Executor();
  }

 private:
  std::shared_ptr<State> state_;
};

}  // namespace eventual::futures
