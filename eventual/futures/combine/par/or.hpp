#pragma once

#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/traits/value_of.hpp>

#include <eventual/result/types/either.hpp>

namespace eventual::futures {

// First event wins, success or failure
// The loser keeps running, its result is dropped

// Future<A> -> Future<B> -> Future<Either<A, B>>

template <SomeFuture LeftFuture, SomeFuture RightFuture>
Future<Either<traits::ValueOf<LeftFuture>, traits::ValueOf<RightFuture>>> Or(
    LeftFuture f, RightFuture g) {
  using L = traits::ValueOf<LeftFuture>;
  using R = traits::ValueOf<RightFuture>;

  using Tagged = Either<L, R>;

  auto [raced, promise] = Contract<Tagged>(f.Executor());

  f.Respond([promise](const Try<L>& result) {
    promise.Set(result.Map([](const L& value) {
      return Tagged::MakeLeft(value);
    }));
  });

  g.Respond([promise](const Try<R>& result) {
    promise.Set(result.Map([](const R& value) {
      return Tagged::MakeRight(value);
    }));
  });

  return raced;
}

}  // namespace eventual::futures
