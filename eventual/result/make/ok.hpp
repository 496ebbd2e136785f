#pragma once

#include <eventual/result/types/try.hpp>
#include <eventual/result/types/status.hpp>

namespace eventual::result {

/*
 * Usage:
 *
 * Try<int> t = result::Ok(1);
 *
 * t.Transform([](int v) {
 *   return result::Ok(v + 1);
 * });
 *
 */

template <typename T>
Try<T> Ok(T value) {
  return {std::move(value)};
}

inline Status Ok() {
  return {Unit{}};
}

}  // namespace eventual::result
