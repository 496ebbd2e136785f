#pragma once

#include <eventual/result/types/result.hpp>

namespace eventual::result {

/*
 * Usage:
 *
 * Try<int> t = result::Err(Errc::TimedOut);
 *
 * futures::Value(exe, 1) | futures::Transform([&](Try<int>) {
 *   return futures::Failure<int>(exe, IoError());
 * });
 *
 */

inline auto Err(Error error) {
  return std::unexpected(std::move(error));
}

}  // namespace eventual::result
