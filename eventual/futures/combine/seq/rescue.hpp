#pragma once

#include <eventual/futures/combine/seq/transform.hpp>

#include <eventual/futures/make/ready.hpp>

#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] Rescue {
  F fun;

  explicit Rescue(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  Future<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    auto* exe = &f.Executor();

    return std::move(f) |
           futures::Transform([fun = std::move(fun), exe](
                                  const Try<T>& input) mutable -> Future<T> {
             if (input.IsFailure()) {
               return fun(input.GetError());
             }
             return Ready(*exe, input);
           });
  }
};

}  // namespace pipe

// Future<T> -> (Error -> Future<T>) -> Future<T>

template <typename F>
auto Rescue(F fun) {
  return pipe::Rescue{std::move(fun)};
}

}  // namespace eventual::futures
