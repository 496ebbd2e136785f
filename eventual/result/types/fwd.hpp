#pragma once

namespace eventual {

template <typename T>
class Try;

template <typename L, typename R>
class Either;

}  // namespace eventual
