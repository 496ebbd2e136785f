#pragma once

#include <eventual/futures/detail/complete.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/syntax/pipe.hpp>

#include <eventual/result/complete/invoke.hpp>

#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] Map {
  F fun;

  explicit Map(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  auto Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;
    using U = result::InvokeValue<F&, const T&>;

    auto [mapped, promise] = Contract<U>(f.Executor());

    f.Respond([fun = std::move(fun), promise](const Try<T>& input) mutable {
      detail::CompleteWith(promise, [&] {
        return input.Map(fun);
      });
    });

    return mapped;
  }
};

}  // namespace pipe

// Future<T> -> (T -> U) -> Future<U>

template <typename F>
auto Map(F fun) {
  return pipe::Map{std::move(fun)};
}

}  // namespace eventual::futures
