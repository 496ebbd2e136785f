#pragma once

#include <eventual/result/types/fwd.hpp>

#include <type_traits>

namespace eventual::result::traits {

namespace match {

template <typename X>
struct ValueOf {};

template <typename T>
struct ValueOf<Try<T>> {
  using Type = T;
};

}  // namespace match

template <typename X>
using ValueOf = typename match::ValueOf<std::remove_cvref_t<X>>::Type;

template <typename X>
concept SomeTry = requires {
  typename match::ValueOf<std::remove_cvref_t<X>>::Type;
};

}  // namespace eventual::result::traits
