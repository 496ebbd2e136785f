#pragma once

#include <eventual/futures/types/future.hpp>

#include <eventual/result/complete/wrap.hpp>

#include <utility>

namespace eventual::futures {

/*
 * Usage:
 *
 * auto f = futures::Submit(pool, [] {
 *   return 42;
 * });
 *
 * () -> void yields Future<Unit>, () -> Try<T> yields Future<T>
 *
 */

template <typename F>
auto Submit(executors::IExecutor& exe, F fun) {
  using T = result::traits::ValueOf<result::Wrapped<F&>>;

  return Future<T>(exe, [fun = std::move(fun)](Promise<T> p) mutable {
    p.Set(result::InvokeWrapped(fun));
  });
}

}  // namespace eventual::futures
