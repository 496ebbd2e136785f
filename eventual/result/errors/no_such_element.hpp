#pragma once

#include <eventual/result/errors/errc.hpp>

#include <string>
#include <system_error>

namespace eventual {

// Produced by Filter when the predicate rejects a value

class NoSuchElementError : public std::system_error {
 public:
  explicit NoSuchElementError(const std::string& message)
      : std::system_error(make_error_code(Errc::NoSuchElement), message) {
  }
};

}  // namespace eventual
