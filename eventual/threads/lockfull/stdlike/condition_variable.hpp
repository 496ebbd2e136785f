#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <cstdint>

namespace eventual::threads::lockfull::stdlike {

class CondVar {
  using Epoch = uint32_t;

 public:
  CondVar() = default;

  // Pinned
  CondVar(const CondVar&) = delete;
  CondVar& operator=(const CondVar&) = delete;

  CondVar(CondVar&&) = delete;
  CondVar& operator=(CondVar&&) = delete;

  // Mutex - BasicLockable
  // https://en.cppreference.com/w/cpp/named_req/BasicLockable
  template <class Mutex>
  void Wait(Mutex& mutex) {
    Epoch entry = epoch_.load(std::memory_order::relaxed);

    mutex.unlock();

    twist::ed::futex::Wait(epoch_, entry, std::memory_order::relaxed);

    mutex.lock();
  }

  void NotifyOne() {
    auto wake_key = twist::ed::futex::PrepareWake(epoch_);
    epoch_.fetch_add(1, std::memory_order::relaxed);
    twist::ed::futex::WakeOne(wake_key);
  }

  void NotifyAll() {
    auto wake_key = twist::ed::futex::PrepareWake(epoch_);
    epoch_.fetch_add(1, std::memory_order::relaxed);
    twist::ed::futex::WakeAll(wake_key);
  }

 private:
  twist::ed::stdlike::atomic<Epoch> epoch_{0};
};

}  // namespace eventual::threads::lockfull::stdlike
