#pragma once

#include <eventual/futures/types/future.hpp>

#include <memory>
#include <tuple>

namespace eventual::futures {

/*
 * Usage:
 *
 * auto [f, p] = futures::Contract<int>(pool);
 *
 * // Later
 * p.SetValue(7);
 *
 */

template <typename T>
std::tuple<Future<T>, Promise<T>> Contract(executors::IExecutor& exe) {
  auto state = std::make_shared<detail::SharedState<T>>(exe);
  return {Future<T>(state), Promise<T>(state)};
}

}  // namespace eventual::futures
