#pragma once

#include <eventual/futures/detail/complete.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/syntax/pipe.hpp>

#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] Handle {
  F fun;

  explicit Handle(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  Future<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    auto [handled, promise] = Contract<T>(f.Executor());

    f.Respond([fun = std::move(fun), promise](const Try<T>& input) mutable {
      detail::CompleteWith(promise, [&] {
        return input.Handle(fun);
      });
    });

    return handled;
  }
};

}  // namespace pipe

// Future<T> -> (Error -> T) -> Future<T>

template <typename F>
auto Handle(F fun) {
  return pipe::Handle{std::move(fun)};
}

}  // namespace eventual::futures
