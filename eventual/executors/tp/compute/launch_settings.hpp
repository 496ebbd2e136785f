#pragma once

namespace eventual::executors::tp::compute {

// launch modes

const bool kCollectMetrics = true;

}  // namespace eventual::executors::tp::compute
