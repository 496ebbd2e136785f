#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstdint>

namespace eventual::threads::lockfull::stdlike {

// Futex-based mutex, parks waiters in the kernel

class Mutex {
 public:
  Mutex() = default;

  // Pinned
  Mutex(const Mutex&) = delete;
  Mutex& operator=(const Mutex&) = delete;

  Mutex(Mutex&&) = delete;
  Mutex& operator=(Mutex&&) = delete;

  void Lock();

  bool TryLock() {
    return CompareExchange(kUnlocked, kLocked) == kUnlocked;
  }

  void Unlock();

  // Lockable
  // https://en.cppreference.com/w/cpp/named_req/Lockable

  void lock() {  // NOLINT
    Lock();
  }

  bool try_lock() {  // NOLINT
    return TryLock();
  }

  void unlock() {  // NOLINT
    Unlock();
  }

 private:
  uint32_t CompareExchange(uint32_t expected, uint32_t desired) {
    state_.compare_exchange_strong(expected, desired,
                                   std::memory_order::acquire,
                                   std::memory_order::relaxed);
    return expected;
  }

 private:
  static constexpr uint32_t kUnlocked = 0;
  static constexpr uint32_t kLocked = 1;
  static constexpr uint32_t kContended = 2;

  twist::ed::stdlike::atomic<uint32_t> state_{kUnlocked};
};

}  // namespace eventual::threads::lockfull::stdlike
