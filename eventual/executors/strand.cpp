#include <eventual/executors/strand.hpp>
#include <eventual/executors/submit.hpp>

#include <mutex>
#include <utility>

namespace eventual::executors {

Strand::Strand(IExecutor& underlying)
    : state_(std::make_shared<State>(underlying)) {
}

void Strand::Submit(Task* task) {
  state_->Push(task);
}

void Strand::State::Push(Task* task) {
  bool idle = false;

  {
    std::lock_guard guard(spinlock_);

    tasks_.PushBack(task);
    idle = !std::exchange(scheduled_, true);
  }

  if (idle) {
    Schedule();
  }
}

void Strand::State::Schedule() {
  executors::Submit(underlying_, [self = shared_from_this()] {
    self->RunBatch();
  });
}

void Strand::State::RunBatch() noexcept {
  wheels::IntrusiveList<Task> batch;

  {
    std::lock_guard guard(spinlock_);

    while (!tasks_.IsEmpty()) {
      batch.PushBack(tasks_.PopFront());
    }
  }

  while (!batch.IsEmpty()) {
    batch.PopFront()->Run();
  }

  {
    std::lock_guard guard(spinlock_);

    if (tasks_.IsEmpty()) {
      scheduled_ = false;
      return;
    }
  }

  // Tasks arrived during the batch, let other work run first
  Schedule();
}

}  // namespace eventual::executors
