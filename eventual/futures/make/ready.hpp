#pragma once

#include <eventual/futures/types/future.hpp>

#include <utility>

namespace eventual::futures {

// Completes through exe, not synchronously

template <typename T>
Future<T> Ready(executors::IExecutor& exe, Try<T> result) {
  return Future<T>(exe, [result = std::move(result)](Promise<T> p) {
    p.Set(result);
  });
}

}  // namespace eventual::futures
