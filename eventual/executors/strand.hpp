#pragma once

#include <eventual/executors/executor.hpp>

#include <eventual/threads/lockfull/spinlock.hpp>

#include <wheels/intrusive/list.hpp>

#include <memory>

namespace eventual::executors {

// Strand / serial executor / asynchronous mutex
// Tasks run one at a time in submission order on the underlying executor

class Strand : public IExecutor {
 public:
  explicit Strand(IExecutor& underlying);

  // Non-copyable
  Strand(const Strand&) = delete;
  Strand& operator=(const Strand&) = delete;

  // Non-movable
  Strand(Strand&&) = delete;
  Strand& operator=(Strand&&) = delete;

  // IExecutor
  void Submit(Task* task) override;

 private:
  // Outlives the strand while a batch is scheduled
  class State : public std::enable_shared_from_this<State> {
   public:
    explicit State(IExecutor& underlying)
        : underlying_(underlying) {
    }

    void Push(Task* task);

   private:
    void Schedule();

    void RunBatch() noexcept;

   private:
    IExecutor& underlying_;
    threads::lockfull::SpinLock spinlock_;
    wheels::IntrusiveList<Task> tasks_;  // guarded by spinlock_
    bool scheduled_{false};              // guarded by spinlock_
  };

 private:
  std::shared_ptr<State> state_;
};

}  // namespace eventual::executors
