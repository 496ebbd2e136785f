#pragma once

#include <eventual/futures/detail/shared_state.hpp>

#include <eventual/result/errors/errc.hpp>
#include <eventual/result/make/err.hpp>
#include <eventual/result/types/error.hpp>

#include <memory>
#include <utility>

namespace eventual::futures {

namespace detail {

// Shared by all copies of a promise
// The last copy gone without a result breaks the promise

template <typename T>
class PromiseCore {
 public:
  explicit PromiseCore(std::shared_ptr<SharedState<T>> state)
      : state_(std::move(state)) {
  }

  // Non-copyable
  PromiseCore(const PromiseCore&) = delete;
  PromiseCore& operator=(const PromiseCore&) = delete;

  ~PromiseCore() {
    state_->Produce(result::Err(Error(Errc::BrokenPromise)));
  }

  bool Set(Try<T> result) {
    return state_->Produce(std::move(result));
  }

  bool IsCompleted() {
    return state_->IsReady();
  }

 private:
  std::shared_ptr<SharedState<T>> state_;
};

}  // namespace detail

/*
 * One-shot completion handle
 *
 * Copies complete the same future, the first Set wins:
 *
 * promise.Set(result::Ok(7));  // true
 * promise.SetValue(8);         // false, ignored
 *
 */

template <typename T>
class Promise {
 public:
  using ValueType = T;

  explicit Promise(std::shared_ptr<detail::SharedState<T>> state)
      : contract_(std::make_shared<detail::PromiseCore<T>>(std::move(state))) {
  }

  // false if the future was already completed
  bool Set(Try<T> result) const {
    return contract_->Set(std::move(result));
  }

  bool SetValue(T value) const {
    return Set(std::move(value));
  }

  bool SetError(Error error) const {
    return Set(result::Err(std::move(error)));
  }

  bool IsCompleted() const {
    return contract_->IsCompleted();
  }

 private:
  std::shared_ptr<detail::PromiseCore<T>> contract_;
};

}  // namespace eventual::futures
