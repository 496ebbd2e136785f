#pragma once

#include <eventual/executors/tp/compute/thread_pool.hpp>

namespace eventual::executors {

// Default thread pool implementation
using ThreadPool = tp::compute::ThreadPool;

}  // namespace eventual::executors
