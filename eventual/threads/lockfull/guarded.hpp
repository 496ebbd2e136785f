#pragma once

#include <eventual/threads/lockfull/stdlike/mutex.hpp>

#include <mutex>
#include <type_traits>
#include <utility>

namespace eventual::threads::lockfull {

// Value accessible only under its own mutex
// Critical sections are expected to be O(1): never call user code in With

template <typename T>
class Guarded {
 public:
  template <typename... Args>
  explicit Guarded(Args&&... args)
      : value_(std::forward<Args>(args)...) {
  }

  // Pinned
  Guarded(const Guarded&) = delete;
  Guarded& operator=(const Guarded&) = delete;

  Guarded(Guarded&&) = delete;
  Guarded& operator=(Guarded&&) = delete;

  T Read() const {
    std::lock_guard guard(mutex_);
    return value_;
  }

  void Write(T value) {
    std::lock_guard guard(mutex_);
    value_ = std::move(value);
  }

  // Runs fun(T&) under the lock
  template <typename F>
  std::invoke_result_t<F, T&> With(F&& fun) {
    std::lock_guard guard(mutex_);
    return fun(value_);
  }

 private:
  mutable stdlike::Mutex mutex_;
  T value_;
};

}  // namespace eventual::threads::lockfull
