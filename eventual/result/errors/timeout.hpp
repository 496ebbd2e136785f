#pragma once

#include <eventual/result/errors/errc.hpp>

#include <chrono>
#include <system_error>

namespace eventual {

// Produced by WithTimeout when the source misses its deadline

class TimeoutError : public std::system_error {
 public:
  using Clock = std::chrono::steady_clock;

  explicit TimeoutError(Clock::time_point deadline)
      : std::system_error(make_error_code(Errc::TimedOut)),
        deadline_(deadline) {
  }

  Clock::time_point Deadline() const {
    return deadline_;
  }

 private:
  Clock::time_point deadline_;
};

}  // namespace eventual
