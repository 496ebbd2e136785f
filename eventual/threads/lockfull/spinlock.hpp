#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/spin.hpp>

namespace eventual::threads::lockfull {

// Test-and-TAS spinlock

class SpinLock {
 public:
  SpinLock() = default;

  // Pinned
  SpinLock(const SpinLock&) = delete;
  SpinLock& operator=(const SpinLock&) = delete;

  SpinLock(SpinLock&&) = delete;
  SpinLock& operator=(SpinLock&&) = delete;

  void Lock() {
    twist::ed::SpinWait spin_wait;
    while (locked_.exchange(true, std::memory_order::acquire)) {
      while (locked_.load(std::memory_order::relaxed)) {
        spin_wait();
      }
    }
  }

  bool TryLock() {
    return !locked_.exchange(true, std::memory_order::acquire);
  }

  void Unlock() {
    locked_.store(false, std::memory_order::release);
  }

  // Lockable

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
  twist::ed::stdlike::atomic<bool> locked_{false};
};

}  // namespace eventual::threads::lockfull
