#pragma once

#include <eventual/executors/task.hpp>

namespace eventual::executors {

// Executors are to function execution as allocators are to memory allocation
// Futures call it a queue: every future is bound to exactly one executor

struct IExecutor {
  virtual ~IExecutor() = default;

  virtual void Submit(Task* task) = 0;
};

}  // namespace eventual::executors
