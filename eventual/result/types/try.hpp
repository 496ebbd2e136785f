#pragma once

#include <eventual/result/types/fwd.hpp>
#include <eventual/result/types/result.hpp>

#include <eventual/result/complete/invoke.hpp>
#include <eventual/result/errors/no_such_element.hpp>
#include <eventual/result/make/err.hpp>
#include <eventual/result/traits/value_of.hpp>

#include <fmt/format.h>

#include <wheels/core/assert.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace eventual {

namespace detail {

template <typename T>
NoSuchElementError PredicateFailure(const T& value) {
  if constexpr (fmt::is_formattable<T>::value) {
    return NoSuchElementError(
        fmt::format("Predicate does not hold for {}", value));
  } else {
    return NoSuchElementError("Predicate does not hold");
  }
}

}  // namespace detail

// Success(T) | Failure(Error)
// Plain immutable value, every operator returns a new Try

template <typename T>
class Try {
 public:
  using ValueType = T;

  Try(T value)  // NOLINT
      : result_(std::in_place, std::move(value)) {
  }

  Try(std::unexpected<Error> error)  // NOLINT
      : result_(std::move(error)) {
  }

  explicit Try(Result<T> result)
      : result_(std::move(result)) {
  }

  bool IsSuccess() const {
    return result_.has_value();
  }

  bool IsFailure() const {
    return !IsSuccess();
  }

  explicit operator bool() const {
    return IsSuccess();
  }

  const T& operator*() const {
    WHEELS_VERIFY(IsSuccess(), "Dereferencing a failed Try");
    return *result_;
  }

  const T* operator->() const {
    return &**this;
  }

  const Error& GetError() const {
    WHEELS_VERIFY(IsFailure(), "Try holds a value");
    return result_.error();
  }

  const Result<T>& AsResult() const {
    return result_;
  }

  // Side effects

  template <typename F>
  const Try& OnSuccess(F&& fun) const {
    if (IsSuccess()) {
      fun(*result_);
    }
    return *this;
  }

  template <typename F>
  const Try& OnFailure(F&& fun) const {
    if (IsFailure()) {
      fun(result_.error());
    }
    return *this;
  }

  template <typename F>
  void Foreach(F&& fun) const {
    OnSuccess(std::forward<F>(fun));
  }

  // Unwrapping

  T GetOrElse(T default_value) const {
    if (IsSuccess()) {
      return *result_;
    }
    return default_value;
  }

  // Throws the stored error
  const T& Get() const& {
    if (IsFailure()) {
      result_.error().Throw();
    }
    return *result_;
  }

  T Get() && {
    if (IsFailure()) {
      result_.error().Throw();
    }
    return std::move(*result_);
  }

  // Combinators

  // T -> Try<U>
  template <typename F>
  requires result::traits::SomeTry<std::invoke_result_t<F&, const T&>>
  std::invoke_result_t<F&, const T&> Transform(F&& fun) const {
    if (IsSuccess()) {
      return fun(*result_);
    }
    return result::Err(result_.error());
  }

  template <typename F>
  auto FlatMap(F&& fun) const {
    return Transform(std::forward<F>(fun));
  }

  // T -> U, void maps to Unit
  template <typename F>
  auto Map(F&& fun) const {
    using U = result::InvokeValue<F&, const T&>;

    return Transform([&fun](const T& value) -> Try<U> {
      return result::InvokeLifted(fun, value);
    });
  }

  // Error -> Try<T>
  template <typename F>
  requires std::convertible_to<std::invoke_result_t<F&, const Error&>, Try>
  Try Rescue(F&& fun) const {
    if (IsFailure()) {
      return fun(result_.error());
    }
    return *this;
  }

  // Error -> T
  template <typename F>
  requires std::convertible_to<std::invoke_result_t<F&, const Error&>, T>
  Try Handle(F&& fun) const {
    return Rescue([&fun](const Error& error) -> Try {
      return fun(error);
    });
  }

  template <typename P>
  Try Filter(P&& pred) const {
    return Transform([this, &pred](const T& value) -> Try {
      if (pred(value)) {
        return *this;
      }
      return result::Err(detail::PredicateFailure(value));
    });
  }

  bool operator==(const Try& that) const
  requires std::equality_comparable<T>
  {
    if (IsSuccess() != that.IsSuccess()) {
      return false;
    }
    if (IsSuccess()) {
      return *result_ == *that.result_;
    }
    return result_.error() == that.result_.error();
  }

 private:
  Result<T> result_;
};

}  // namespace eventual
