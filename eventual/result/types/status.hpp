#pragma once

#include <eventual/result/types/try.hpp>
#include <eventual/result/types/unit.hpp>

namespace eventual {

using Status = Try<Unit>;

}  // namespace eventual
