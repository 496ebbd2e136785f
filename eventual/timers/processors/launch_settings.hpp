#pragma once

#include <eventual/timers/millis.hpp>

namespace eventual::timers {

using namespace std::chrono_literals;

// launch modes

const bool kCollectMetrics = true;

// Lower bound for a single timed sleep of the processor thread
const Millis kMinSleep = 1ms;

}  // namespace eventual::timers
