#pragma once

#include <eventual/executors/executor.hpp>

namespace eventual::executors {

// Executes task immediately on the submitting thread

IExecutor& Inline();

}  // namespace eventual::executors
