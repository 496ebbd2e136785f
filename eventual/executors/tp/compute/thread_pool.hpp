#pragma once

#include <eventual/executors/executor.hpp>

#include <eventual/executors/tp/compute/launch_settings.hpp>

#include <eventual/satellite/logger.hpp>

#include <eventual/support/unbounded_blocking_queue.hpp>

#include <eventual/threads/lockfull/wait_group.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <utility>
#include <vector>

namespace eventual::executors::tp::compute {

// Thread pool for independent CPU-bound tasks
// Fixed pool of worker threads + shared unbounded blocking queue

class ThreadPool : public IExecutor {
 public:
  using Logger = satellite::Logger<kCollectMetrics, /*AtomicMetrics=*/true>;

  explicit ThreadPool(size_t threads);
  ~ThreadPool();

  // Non-copyable
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Non-movable
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  void Start();

  // IExecutor
  void Submit(Task*) override;

  static ThreadPool* Current();

  void WaitIdle();

  void Stop();

  Logger::Metrics Metrics() const {
    return logger_.GatherMetrics();
  }

 private:
  void Worker(size_t index) noexcept;

 private:
  const size_t num_threads_;
  std::vector<twist::ed::stdlike::thread> workers_;
  support::UnboundedBlockingQueue<Task> tasks_;

  // WaitIdle
  threads::lockfull::WaitGroup incomplete_tasks_;

  // Shard per worker, the last one for submitters
  Logger logger_;
};

}  // namespace eventual::executors::tp::compute
