#pragma once

#include <eventual/futures/make/value.hpp>

#include <eventual/result/types/unit.hpp>

namespace eventual::futures {

inline Future<Unit> Just(executors::IExecutor& exe) {
  return Value(exe, Unit{});
}

}  // namespace eventual::futures
