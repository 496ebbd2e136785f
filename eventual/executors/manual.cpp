#include <eventual/executors/manual.hpp>

#include <mutex>

namespace eventual::executors {

void ManualExecutor::Submit(Task* task) {
  std::lock_guard guard(spinlock_);

  tasks_.PushBack(task);
  ++size_;
}

Task* ManualExecutor::TryPop() {
  std::lock_guard guard(spinlock_);

  if (tasks_.IsEmpty()) {
    return nullptr;
  }

  --size_;
  return tasks_.PopFront();
}

size_t ManualExecutor::RunAtMost(size_t limit) {
  size_t tasks_done = 0;

  while (tasks_done < limit) {
    Task* next = TryPop();
    if (next == nullptr) {
      break;
    }

    next->Run();
    ++tasks_done;
  }

  return tasks_done;
}

size_t ManualExecutor::Drain() {
  size_t tasks_done = 0;

  while (Task* next = TryPop()) {
    next->Run();
    ++tasks_done;
  }

  return tasks_done;
}

size_t ManualExecutor::TaskCount() const {
  std::lock_guard guard(spinlock_);
  return size_;
}

}  // namespace eventual::executors
