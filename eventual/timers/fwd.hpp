#pragma once

namespace eventual::timers {

struct IProcessor;

class TimerBase;

class Handle;

}  // namespace eventual::timers
