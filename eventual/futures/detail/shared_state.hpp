#pragma once

#include <eventual/executors/executor.hpp>
#include <eventual/executors/submit.hpp>

#include <eventual/result/types/try.hpp>

#include <eventual/threads/lockfull/guarded.hpp>

#include <function2/function2.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace eventual::futures::detail {

// Write-once result + observers registered before completion
// Observers always run on the bound executor, never under the lock

template <typename T>
class SharedState {
 public:
  using Callback = fu2::unique_function<void(const Try<T>&)>;

  explicit SharedState(executors::IExecutor& exe)
      : executor_(exe) {
  }

  // Non-copyable
  SharedState(const SharedState&) = delete;
  SharedState& operator=(const SharedState&) = delete;

  executors::IExecutor& Executor() const {
    return executor_;
  }

  // false if the result was already set
  bool Produce(Try<T> result) {
    auto callbacks = slot_.With(
        [&result](Slot& slot) -> std::optional<std::vector<Callback>> {
          if (slot.result.has_value()) {
            return std::nullopt;
          }
          slot.result.emplace(result);
          return std::exchange(slot.callbacks, {});
        });

    if (!callbacks) {
      return false;
    }

    if (!callbacks->empty()) {
      // Single task keeps registration order
      executors::Submit(executor_, [result = std::move(result),
                                    callbacks = std::move(*callbacks)]() mutable {
        for (auto& callback : callbacks) {
          callback(result);
        }
      });
    }

    return true;
  }

  void Subscribe(Callback callback) {
    auto ready = slot_.With([&callback](Slot& slot) -> std::optional<Try<T>> {
      if (slot.result.has_value()) {
        return slot.result;
      }
      slot.callbacks.push_back(std::move(callback));
      return std::nullopt;
    });

    if (ready) {
      executors::Submit(executor_, [result = std::move(*ready),
                                    callback = std::move(callback)]() mutable {
        callback(result);
      });
    }
  }

  std::optional<Try<T>> Peek() {
    return slot_.With([](Slot& slot) {
      return slot.result;
    });
  }

  bool IsReady() {
    return slot_.With([](Slot& slot) {
      return slot.result.has_value();
    });
  }

 private:
  struct Slot {
    std::optional<Try<T>> result{};
    std::vector<Callback> callbacks{};
  };

  executors::IExecutor& executor_;
  threads::lockfull::Guarded<Slot> slot_{};
};

}  // namespace eventual::futures::detail
