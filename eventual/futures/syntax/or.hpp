#pragma once

#include <eventual/futures/combine/par/or.hpp>

#include <utility>

template <eventual::futures::SomeFuture LeftFuture,
          eventual::futures::SomeFuture RightFuture>
auto operator||(LeftFuture f, RightFuture g) {
  return eventual::futures::Or(std::move(f), std::move(g));
}
