#pragma once

#include <eventual/futures/make/ready.hpp>

#include <eventual/result/make/err.hpp>

#include <utility>

namespace eventual::futures {

/*
 * Usage:
 *
 * auto f = futures::Failure<int>(pool, Errc::TimedOut);
 *
 */

template <typename T>
Future<T> Failure(executors::IExecutor& exe, Error error) {
  return Ready<T>(exe, result::Err(std::move(error)));
}

}  // namespace eventual::futures
