#pragma once

#include <eventual/futures/syntax/pipe.hpp>

#include <eventual/threads/blocking/event.hpp>

#include <optional>
#include <utility>

namespace eventual::futures {

namespace pipe {

struct [[nodiscard]] Await {
  template <SomeFuture InputFuture>
  Try<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    threads::blocking::Event ready;
    std::optional<Try<T>> result;

    f.Respond([&](const Try<T>& r) {
      result.emplace(r);
      ready.Set();
    });

    ready.Wait();

    return std::move(*result);
  }
};

}  // namespace pipe

/*
 * Blocks the caller until the future completes
 *
 * auto result = futures::Submit(pool, [] {
 *   return 7;
 * }) | futures::Await();
 *
 * Never call from the future's own executor thread
 *
 */

inline auto Await() {
  return pipe::Await{};
}

}  // namespace eventual::futures
