#pragma once

#include <eventual/threads/lockfull/stdlike/condition_variable.hpp>
#include <eventual/threads/lockfull/stdlike/mutex.hpp>

#include <wheels/intrusive/list.hpp>

#include <mutex>

namespace eventual::support {

// Unbounded blocking multi-producers/multi-consumers (MPMC) queue

template <typename T>
class UnboundedBlockingQueue {
 public:
  // false if the queue was closed
  bool Put(T* object) {
    std::lock_guard guard(mutex_);

    if (!is_open_) {
      return false;
    }

    queue_.PushBack(object);
    not_empty_.NotifyOne();

    return true;
  }

  // nullptr iff the queue is closed and drained
  T* Take() {
    std::unique_lock lock(mutex_);

    while (is_open_ && queue_.IsEmpty()) {
      not_empty_.Wait(lock);
    }

    if (queue_.IsEmpty()) {
      return nullptr;
    }

    return queue_.PopFront();
  }

  void Close() {
    std::lock_guard guard(mutex_);

    is_open_ = false;
    not_empty_.NotifyAll();
  }

 private:
  threads::lockfull::stdlike::Mutex mutex_;
  threads::lockfull::stdlike::CondVar not_empty_;
  bool is_open_{true};               // guarded by mutex_
  wheels::IntrusiveList<T> queue_;  // guarded by mutex_
};

}  // namespace eventual::support
