#pragma once

#include <eventual/futures/types/promise.hpp>

#include <eventual/threads/lockfree/counter.hpp>
#include <eventual/threads/lockfull/guarded.hpp>

#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace eventual::futures::detail {

// Successes are stored and counted, the last one completes the join
// A failure completes the join directly, bypassing the counter

template <typename L, typename R>
class JoinBlock {
  struct Slots {
    std::optional<L> left{};
    std::optional<R> right{};
  };

 public:
  using ValueType = std::tuple<L, R>;

  explicit JoinBlock(Promise<ValueType> promise)
      : promise_(std::move(promise)) {
  }

  void ProduceLeft(const Try<L>& result) {
    if (result.IsFailure()) {
      promise_.SetError(result.GetError());
      return;
    }

    slots_.With([&result](Slots& slots) {
      slots.left.emplace(*result);
    });

    Arrive();
  }

  void ProduceRight(const Try<R>& result) {
    if (result.IsFailure()) {
      promise_.SetError(result.GetError());
      return;
    }

    slots_.With([&result](Slots& slots) {
      slots.right.emplace(*result);
    });

    Arrive();
  }

 private:
  void Arrive() {
    if (arrived_.IncrementAndGet() == 2) {
      auto value = slots_.With([](Slots& slots) {
        return ValueType(std::move(*slots.left), std::move(*slots.right));
      });
      promise_.SetValue(std::move(value));
    }
  }

 private:
  Promise<ValueType> promise_;
  threads::lockfull::Guarded<Slots> slots_{};
  threads::lockfree::AtomicCounter arrived_{};
};

// N-ary version, values keep input order

template <typename T>
class AllBlock {
 public:
  using ValueType = std::vector<T>;

  AllBlock(Promise<ValueType> promise, size_t count)
      : promise_(std::move(promise)),
        count_(count),
        slots_(count) {
  }

  void Produce(size_t index, const Try<T>& result) {
    if (result.IsFailure()) {
      promise_.SetError(result.GetError());
      return;
    }

    slots_.With([index, &result](std::vector<std::optional<T>>& slots) {
      slots[index].emplace(*result);
    });

    if (arrived_.IncrementAndGet() == static_cast<int64_t>(count_)) {
      auto values = slots_.With([](std::vector<std::optional<T>>& slots) {
        ValueType values;
        values.reserve(slots.size());
        for (auto& slot : slots) {
          values.push_back(std::move(*slot));
        }
        return values;
      });
      promise_.SetValue(std::move(values));
    }
  }

 private:
  Promise<ValueType> promise_;
  const size_t count_;
  threads::lockfull::Guarded<std::vector<std::optional<T>>> slots_;
  threads::lockfree::AtomicCounter arrived_{};
};

}  // namespace eventual::futures::detail
