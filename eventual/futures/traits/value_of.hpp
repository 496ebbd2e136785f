#pragma once

#include <eventual/futures/types/future.hpp>

#include <type_traits>

namespace eventual::futures {

namespace match {

template <typename F>
struct ValueOf {};

template <typename T>
struct ValueOf<Future<T>> {
  using Type = T;
};

}  // namespace match

namespace traits {

template <typename F>
using ValueOf = typename match::ValueOf<std::remove_cvref_t<F>>::Type;

}  // namespace traits

template <typename F>
concept SomeFuture = requires {
  typename traits::ValueOf<F>;
};

}  // namespace eventual::futures
