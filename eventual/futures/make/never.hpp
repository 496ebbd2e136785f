#pragma once

#include <eventual/futures/types/future.hpp>

#include <memory>

namespace eventual::futures {

// No promise exists, so the future stays pending forever

template <typename T>
Future<T> Never(executors::IExecutor& exe) {
  return Future<T>(std::make_shared<detail::SharedState<T>>(exe));
}

}  // namespace eventual::futures
