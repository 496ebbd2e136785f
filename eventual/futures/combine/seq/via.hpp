#pragma once

#include <eventual/futures/detail/complete.hpp>
#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/syntax/pipe.hpp>

namespace eventual::futures {

namespace pipe {

struct [[nodiscard]] Via {
  executors::IExecutor* executor;

  template <SomeFuture InputFuture>
  Future<traits::ValueOf<InputFuture>> Pipe(InputFuture f) {
    using T = traits::ValueOf<InputFuture>;

    auto [moved, promise] = Contract<T>(*executor);
    f.Respond(detail::ForwardTo(promise));

    return moved;
  }
};

}  // namespace pipe

// Same result, observers of the output run on exe

inline auto Via(executors::IExecutor& exe) {
  return pipe::Via{&exe};
}

}  // namespace eventual::futures
