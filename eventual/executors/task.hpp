#pragma once

#include <wheels/intrusive/list.hpp>

namespace eventual::executors {

struct ITask {
  virtual ~ITask() = default;

  virtual void Run() noexcept = 0;
};

// Intrusive so that executors never allocate on Submit

struct Task : public ITask, public wheels::IntrusiveListNode<Task> {};

}  // namespace eventual::executors
