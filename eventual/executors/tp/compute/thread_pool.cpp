#include <eventual/executors/tp/compute/thread_pool.hpp>

#include <twist/ed/local/ptr.hpp>

#include <wheels/core/assert.hpp>

namespace eventual::executors::tp::compute {

static twist::ed::ThreadLocalPtr<ThreadPool> pool;

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads),
      logger_({"tasks.submitted", "tasks.completed"}, num_threads + 1) {
}

void ThreadPool::Start() {
  for (size_t i = 0; i < num_threads_; i++) {
    workers_.emplace_back([this, i]() {
      Worker(i);
    });
  }
}

void ThreadPool::Worker(size_t index) noexcept {
  pool = this;

  auto* metrics = logger_.Shard(index);

  while (Task* next = tasks_.Take()) {
    next->Run();

    metrics->Increment("tasks.completed", 1);
    incomplete_tasks_.Done();
  }
}

ThreadPool::~ThreadPool() {
  WHEELS_VERIFY(workers_.empty(), "ThreadPool destroyed before Stop");
}

void ThreadPool::Submit(Task* task) {
  logger_.Shard(num_threads_)->Increment("tasks.submitted", 1);

  incomplete_tasks_.Add(1);
  bool accepted = tasks_.Put(task);
  WHEELS_VERIFY(accepted, "Submit to a stopped ThreadPool");
}

ThreadPool* ThreadPool::Current() {
  return pool;
}

void ThreadPool::WaitIdle() {
  incomplete_tasks_.Wait();
}

void ThreadPool::Stop() {
  tasks_.Close();

  for (auto& thread : workers_) {
    thread.join();
  }

  workers_.clear();
}

}  // namespace eventual::executors::tp::compute
