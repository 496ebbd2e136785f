#pragma once

#include <eventual/executors/executor.hpp>

#include <eventual/threads/lockfull/spinlock.hpp>

#include <wheels/intrusive/list.hpp>

#include <cstddef>

namespace eventual::executors {

// Single-threaded deterministic executor, tasks run only when asked to
// Submit is safe to call from any thread

class ManualExecutor : public IExecutor {
 public:
  ManualExecutor() = default;

  // Non-copyable
  ManualExecutor(const ManualExecutor&) = delete;
  ManualExecutor& operator=(const ManualExecutor&) = delete;

  // Non-movable
  ManualExecutor(ManualExecutor&&) = delete;
  ManualExecutor& operator=(ManualExecutor&&) = delete;

  // IExecutor
  void Submit(Task* task) override;

  // Run tasks

  // Tasks submitted while running are included
  size_t RunAtMost(size_t limit);

  bool RunNext() {
    return RunAtMost(1) == 1;
  }

  // Until the queue is empty
  size_t Drain();

  size_t TaskCount() const;

  bool IsEmpty() const {
    return TaskCount() == 0;
  }

  bool NonEmpty() const {
    return !IsEmpty();
  }

 private:
  Task* TryPop();

 private:
  mutable threads::lockfull::SpinLock spinlock_;
  wheels::IntrusiveList<Task> tasks_;  // guarded by spinlock_
  size_t size_{0};                     // guarded by spinlock_
};

}  // namespace eventual::executors
