#pragma once

#include <eventual/futures/traits/value_of.hpp>

#include <utility>

template <eventual::futures::SomeFuture Future, typename C>
auto operator|(Future f, C c) {
  return c.Pipe(std::move(f));
}
