#pragma once

#include <eventual/result/types/unit.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace eventual::result {

// (Args -> void) -> Unit
// (Args -> T) -> T
template <typename F, typename... Args>
using InvokeValue =
    std::conditional_t<std::is_void_v<std::invoke_result_t<F, Args...>>, Unit,
                       std::invoke_result_t<F, Args...>>;

template <typename F, typename... Args>
InvokeValue<F, Args...> InvokeLifted(F& fun, Args&&... args) {
  if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
    std::invoke(fun, std::forward<Args>(args)...);
    return Unit{};
  } else {
    return std::invoke(fun, std::forward<Args>(args)...);
  }
}

}  // namespace eventual::result
