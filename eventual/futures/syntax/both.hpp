#pragma once

#include <eventual/futures/combine/par/join.hpp>

#include <utility>

template <eventual::futures::SomeFuture LeftFuture,
          eventual::futures::SomeFuture RightFuture>
auto operator+(LeftFuture f, RightFuture g) {
  return eventual::futures::Join(std::move(f), std::move(g));
}
