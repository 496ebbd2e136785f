#pragma once

#include <eventual/futures/detail/complete.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/syntax/pipe.hpp>

#include <exception>
#include <type_traits>
#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] Transform {
  F fun;

  explicit Transform(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  auto Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;
    using OutputFuture = std::invoke_result_t<F&, const Try<T>&>;

    static_assert(SomeFuture<OutputFuture>,
                  "Transform expects Try<T> -> Future<U>");

    using U = traits::ValueOf<OutputFuture>;

    auto [transformed, promise] = Contract<U>(f.Executor());

    f.Respond([fun = std::move(fun), promise](const Try<T>& input) mutable {
      try {
        fun(input).Respond(detail::ForwardTo(promise));
      } catch (const std::exception&) {
        promise.SetError(Error::FromCurrentException());
      }
    });

    return transformed;
  }
};

}  // namespace pipe

// Future<T> -> (Try<T> -> Future<U>) -> Future<U>

template <typename F>
auto Transform(F fun) {
  return pipe::Transform{std::move(fun)};
}

}  // namespace eventual::futures
