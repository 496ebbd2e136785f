#pragma once

#include <eventual/futures/make/ready.hpp>

#include <utility>

namespace eventual::futures {

template <typename T>
Future<T> Value(executors::IExecutor& exe, T value) {
  return Ready<T>(exe, std::move(value));
}

}  // namespace eventual::futures
