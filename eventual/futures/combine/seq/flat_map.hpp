#pragma once

#include <eventual/futures/combine/seq/transform.hpp>

#include <eventual/futures/make/failure.hpp>

#include <type_traits>
#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] FlatMap {
  F fun;

  explicit FlatMap(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  auto Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;
    using U = traits::ValueOf<std::invoke_result_t<F&, const T&>>;

    auto* exe = &f.Executor();

    return std::move(f) |
           futures::Transform([fun = std::move(fun), exe](
                                  const Try<T>& input) mutable -> Future<U> {
             if (input.IsSuccess()) {
               return fun(*input);
             }
             return Failure<U>(*exe, input.GetError());
           });
  }
};

}  // namespace pipe

// Future<T> -> (T -> Future<U>) -> Future<U>

template <typename F>
auto FlatMap(F fun) {
  return pipe::FlatMap{std::move(fun)};
}

}  // namespace eventual::futures
