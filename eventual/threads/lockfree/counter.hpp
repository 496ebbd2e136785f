#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstdint>

namespace eventual::threads::lockfree {

class AtomicCounter {
 public:
  explicit AtomicCounter(int64_t initial = 0)
      : value_(initial) {
  }

  // Pinned
  AtomicCounter(const AtomicCounter&) = delete;
  AtomicCounter& operator=(const AtomicCounter&) = delete;

  int64_t IncrementAndGet() {
    return value_.fetch_add(1, std::memory_order::acq_rel) + 1;
  }

  int64_t DecrementAndGet() {
    return value_.fetch_sub(1, std::memory_order::acq_rel) - 1;
  }

  int64_t Get() const {
    return value_.load(std::memory_order::acquire);
  }

 private:
  twist::ed::stdlike::atomic<int64_t> value_;
};

}  // namespace eventual::threads::lockfree
