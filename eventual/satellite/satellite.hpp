#pragma once

#include <eventual/timers/fwd.hpp>

namespace eventual::satellite {

// Process-wide timer processor
// Lives as long as the caller keeps it alive, reset it before destruction

void MakeVisible(timers::IProcessor*);

void ResetGlobalProcessor();

timers::IProcessor* GetProcessor();

}  // namespace eventual::satellite
