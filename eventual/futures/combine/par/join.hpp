#pragma once

#include <eventual/futures/detail/join_block.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/traits/value_of.hpp>

#include <memory>
#include <tuple>

namespace eventual::futures {

/*
 * Both successes or the first failure
 *
 * auto f = futures::Join(futures::Value(pool, 1),
 *                        futures::Value(pool, std::string("x")));
 *
 * Neither side is cancelled when the other fails
 *
 */

// Future<A> -> Future<B> -> Future<std::tuple<A, B>>

template <SomeFuture LeftFuture, SomeFuture RightFuture>
Future<std::tuple<traits::ValueOf<LeftFuture>, traits::ValueOf<RightFuture>>>
Join(LeftFuture f, RightFuture g) {
  using L = traits::ValueOf<LeftFuture>;
  using R = traits::ValueOf<RightFuture>;

  using Block = detail::JoinBlock<L, R>;

  auto [joined, promise] = Contract<typename Block::ValueType>(f.Executor());

  auto block = std::make_shared<Block>(promise);

  f.Respond([block](const Try<L>& result) {
    block->ProduceLeft(result);
  });

  g.Respond([block](const Try<R>& result) {
    block->ProduceRight(result);
  });

  return joined;
}

}  // namespace eventual::futures
