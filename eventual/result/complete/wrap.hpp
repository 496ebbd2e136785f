#pragma once

#include <eventual/result/complete/invoke.hpp>
#include <eventual/result/traits/value_of.hpp>
#include <eventual/result/types/result.hpp>
#include <eventual/result/types/try.hpp>

#include <type_traits>
#include <utility>

namespace eventual::result {

namespace match {

template <typename X>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<Result<T>> : std::true_type {
  using ValueType = T;
};

}  // namespace match

// (Args -> Try<T>) -> Try<T>
// (Args -> Result<T>) -> Try<T>
// (Args -> void) -> Try<Unit>
// (Args -> T) -> Try<T>
template <typename F, typename... Args>
struct WrapOutput {
  using Invoked = InvokeValue<F, Args...>;

  using Type = Try<Invoked>;
};

template <typename F, typename... Args>
requires traits::SomeTry<InvokeValue<F, Args...>>
struct WrapOutput<F, Args...> {
  using Type = InvokeValue<F, Args...>;
};

template <typename F, typename... Args>
requires match::IsResult<InvokeValue<F, Args...>>::value
struct WrapOutput<F, Args...> {
  using Type = Try<typename match::IsResult<InvokeValue<F, Args...>>::ValueType>;
};

template <typename F, typename... Args>
using Wrapped = typename WrapOutput<F, Args...>::Type;

template <typename F, typename... Args>
Wrapped<F, Args...> InvokeWrapped(F& fun, Args&&... args) {
  return Wrapped<F, Args...>(InvokeLifted(fun, std::forward<Args>(args)...));
}

}  // namespace eventual::result
