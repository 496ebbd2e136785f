#include <eventual/satellite/satellite.hpp>

#include <twist/ed/stdlike/atomic.hpp>

namespace eventual::satellite {

static twist::ed::stdlike::atomic<timers::IProcessor*> global_proc{nullptr};

void MakeVisible(timers::IProcessor* proc) {
  global_proc.store(proc, std::memory_order::release);
}

void ResetGlobalProcessor() {
  global_proc.store(nullptr, std::memory_order::release);
}

timers::IProcessor* GetProcessor() {
  return global_proc.load(std::memory_order::acquire);
}

}  // namespace eventual::satellite
