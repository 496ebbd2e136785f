#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstddef>
#include <type_traits>
#include <vector>

namespace eventual::threads::lockfree {

template <typename T>
requires std::is_default_constructible_v<T>
class AtomicArray {
 private:
  struct Slot {
    twist::ed::stdlike::atomic<T> obj_{T{}};
  };

 public:
  explicit AtomicArray(size_t count)
      : storage_(count) {
  }

  T Load(size_t index) const {
    return storage_[index].obj_.load(std::memory_order::relaxed);
  }

  void FetchAdd(size_t index, T diff) {
    storage_[index].obj_.fetch_add(diff, std::memory_order::relaxed);
  }

  void Store(size_t index, T next) {
    storage_[index].obj_.store(next, std::memory_order::relaxed);
  }

  size_t Size() const {
    return storage_.size();
  }

 private:
  std::vector<Slot> storage_;
};

template <typename T, bool Atomic>
class MaybeAtomicArray {
 public:
  explicit MaybeAtomicArray(size_t count)
      : impl_(count) {
  }

  T Load(size_t index) const {
    return impl_[index];
  }

  void FetchAdd(size_t index, T diff) {
    impl_[index] += diff;
  }

  void Store(size_t index, T next) {
    impl_[index] = next;
  }

  size_t Size() const {
    return impl_.size();
  }

 private:
  std::vector<T> impl_;
};

template <typename T>
class MaybeAtomicArray<T, true> : public AtomicArray<T> {
 public:
  using AtomicArray<T>::AtomicArray;
};

}  // namespace eventual::threads::lockfree
