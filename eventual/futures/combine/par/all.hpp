#pragma once

#include <eventual/futures/detail/join_block.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/traits/value_of.hpp>

#include <wheels/core/assert.hpp>

#include <memory>
#include <vector>

namespace eventual::futures {

// All successes in input order or the first failure

// std::vector<Future<T>> -> Future<std::vector<T>>

template <SomeFuture InputFuture>
Future<std::vector<traits::ValueOf<InputFuture>>> All(
    std::vector<InputFuture> vec) {
  WHEELS_VERIFY(!vec.empty(), "Sending empty vector!");

  using T = traits::ValueOf<InputFuture>;

  using Block = detail::AllBlock<T>;

  auto [all, promise] =
      Contract<typename Block::ValueType>(vec.front().Executor());

  auto block = std::make_shared<Block>(promise, vec.size());

  for (size_t i = 0; i < vec.size(); ++i) {
    vec[i].Respond([block, i](const Try<T>& result) {
      block->Produce(i, result);
    });
  }

  return all;
}

}  // namespace eventual::futures
