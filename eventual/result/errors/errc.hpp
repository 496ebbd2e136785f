#pragma once

#include <string>
#include <system_error>

namespace eventual {

enum class Errc : int {
  NoSuchElement = 1,  // Filter rejected the value
  TimedOut = 2,       // WithTimeout deadline passed
  BrokenPromise = 3,  // Promise destroyed without a result
  Exception = 4,      // User function threw
};

const std::error_category& ErrorCategory();

std::error_code make_error_code(Errc);  // NOLINT

}  // namespace eventual

template <>
struct std::is_error_code_enum<eventual::Errc> : std::true_type {};
