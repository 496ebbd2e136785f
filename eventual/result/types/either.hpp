#pragma once

#include <eventual/result/types/fwd.hpp>

#include <wheels/core/assert.hpp>

#include <concepts>
#include <utility>
#include <variant>

namespace eventual {

// Left(L) | Right(R), sides stay distinguishable when L == R

template <typename L, typename R>
class Either {
 public:
  static Either MakeLeft(L value) {
    return Either(std::in_place_index<0>, std::move(value));
  }

  static Either MakeRight(R value) {
    return Either(std::in_place_index<1>, std::move(value));
  }

  bool IsLeft() const {
    return storage_.index() == 0;
  }

  bool IsRight() const {
    return storage_.index() == 1;
  }

  const L& Left() const {
    WHEELS_VERIFY(IsLeft(), "Either holds Right");
    return std::get<0>(storage_);
  }

  const R& Right() const {
    WHEELS_VERIFY(IsRight(), "Either holds Left");
    return std::get<1>(storage_);
  }

  bool operator==(const Either&) const
  requires std::equality_comparable<L> && std::equality_comparable<R>
  = default;

 private:
  template <size_t Index, typename V>
  Either(std::in_place_index_t<Index> tag, V&& value)
      : storage_(tag, std::forward<V>(value)) {
  }

 private:
  std::variant<L, R> storage_;
};

}  // namespace eventual
