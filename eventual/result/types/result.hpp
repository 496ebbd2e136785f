#pragma once

#include <expected>

#include <eventual/result/types/error.hpp>

namespace eventual {

template <typename T>
using Result = std::expected<T, Error>;

}  // namespace eventual
