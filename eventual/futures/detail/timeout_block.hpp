#pragma once

#include <eventual/futures/types/promise.hpp>

#include <eventual/threads/lockfull/guarded.hpp>

#include <optional>
#include <utility>

namespace eventual::futures::detail {

// Source result vs. timer, whoever takes the promise completes it
// The loser finds the block empty

template <typename T>
class TimeoutBlock {
 public:
  explicit TimeoutBlock(Promise<T> promise)
      : promise_(std::move(promise)) {
  }

  std::optional<Promise<T>> TryTake() {
    return promise_.With([](std::optional<Promise<T>>& promise) {
      return std::exchange(promise, std::nullopt);
    });
  }

 private:
  threads::lockfull::Guarded<std::optional<Promise<T>>> promise_;
};

}  // namespace eventual::futures::detail
