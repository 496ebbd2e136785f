#pragma once

#include <eventual/futures/combine/seq/transform.hpp>

#include <eventual/futures/make/ready.hpp>

#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename P>
struct [[nodiscard]] Filter {
  P pred;

  explicit Filter(P p)
      : pred(std::move(p)) {
  }

  template <SomeFuture InputFuture>
  Future<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    auto* exe = &f.Executor();

    return std::move(f) |
           futures::Transform([pred = std::move(pred), exe](
                                  const Try<T>& input) mutable {
             return Ready(*exe, input.Filter(pred));
           });
  }
};

}  // namespace pipe

// Rejected values become NoSuchElementError

// Future<T> -> (T -> bool) -> Future<T>

template <typename P>
auto Filter(P pred) {
  return pipe::Filter{std::move(pred)};
}

}  // namespace eventual::futures
