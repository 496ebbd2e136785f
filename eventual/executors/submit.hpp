#pragma once

#include <eventual/executors/executor.hpp>
#include <eventual/executors/task.hpp>

#include <utility>

namespace eventual::executors {

namespace detail {

// Owns itself, deleted after Run
template <typename F>
class FunctionTask final : public Task {
 public:
  explicit FunctionTask(F fun)
      : fun_(std::move(fun)) {
  }

  void Run() noexcept override {
    fun_();
    delete this;
  }

 private:
  F fun_;
};

}  // namespace detail

/*
 * Usage:
 *
 * Submit(thread_pool, [] {
 *   fmt::println("Running on thread pool");
 * });
 *
 */

template <typename F>
void Submit(IExecutor& exe, F fun) {
  exe.Submit(new detail::FunctionTask<F>(std::move(fun)));
}

}  // namespace eventual::executors
