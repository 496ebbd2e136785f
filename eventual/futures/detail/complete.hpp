#pragma once

#include <eventual/futures/types/promise.hpp>

#include <eventual/result/types/error.hpp>

#include <exception>

namespace eventual::futures::detail {

// A throwing user function completes the promise with the thrown error
template <typename T, typename F>
void CompleteWith(const Promise<T>& promise, F&& thunk) {
  try {
    promise.Set(thunk());
  } catch (const std::exception&) {
    promise.SetError(Error::FromCurrentException());
  }
}

template <typename T>
auto ForwardTo(Promise<T> promise) {
  return [promise = std::move(promise)](const Try<T>& result) {
    promise.Set(result);
  };
}

}  // namespace eventual::futures::detail
