#pragma once

#include <eventual/futures/syntax/pipe.hpp>

#include <utility>

namespace eventual::futures {

namespace pipe {

template <typename F>
struct [[nodiscard]] OnSuccess {
  F fun;

  explicit OnSuccess(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  InputFuture Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    return f.Respond([fun = std::move(fun)](const Try<T>& result) mutable {
      result.OnSuccess(fun);
    });
  }
};

template <typename F>
struct [[nodiscard]] OnFailure {
  F fun;

  explicit OnFailure(F f)
      : fun(std::move(f)) {
  }

  template <SomeFuture InputFuture>
  InputFuture Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    return f.Respond([fun = std::move(fun)](const Try<T>& result) mutable {
      result.OnFailure(fun);
    });
  }
};

}  // namespace pipe

// Side effects, the input future is returned as is

// Future<T> -> (T -> void) -> Future<T>
template <typename F>
auto OnSuccess(F fun) {
  return pipe::OnSuccess{std::move(fun)};
}

template <typename F>
auto Foreach(F fun) {
  return pipe::OnSuccess{std::move(fun)};
}

// Future<T> -> (Error -> void) -> Future<T>
template <typename F>
auto OnFailure(F fun) {
  return pipe::OnFailure{std::move(fun)};
}

}  // namespace eventual::futures
