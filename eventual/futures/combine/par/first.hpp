#pragma once

#include <eventual/futures/detail/complete.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/traits/value_of.hpp>

#include <wheels/core/assert.hpp>

#include <vector>

namespace eventual::futures {

// First event wins, success or failure

// std::vector<Future<T>> -> Future<T>

template <SomeFuture InputFuture>
Future<traits::ValueOf<InputFuture>> First(std::vector<InputFuture> vec) {
  WHEELS_VERIFY(!vec.empty(), "Sending empty vector!");

  using T = traits::ValueOf<InputFuture>;

  auto [first, promise] = Contract<T>(vec.front().Executor());

  for (auto& f : vec) {
    f.Respond(detail::ForwardTo(promise));
  }

  return first;
}

}  // namespace eventual::futures
