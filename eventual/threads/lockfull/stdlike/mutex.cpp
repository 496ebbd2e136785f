#include <eventual/threads/lockfull/stdlike/mutex.hpp>

#include <twist/ed/wait/futex.hpp>

namespace eventual::threads::lockfull::stdlike {

void Mutex::Lock() {
  if (CompareExchange(kUnlocked, kLocked) == kUnlocked) {
    return;
  }

  // Announce ourselves as a waiter, whoever unlocks must wake someone
  while (state_.exchange(kContended, std::memory_order::acquire) !=
         kUnlocked) {
    twist::ed::futex::Wait(state_, kContended, std::memory_order::relaxed);
  }
}

void Mutex::Unlock() {
  auto wake_key = twist::ed::futex::PrepareWake(state_);

  if (state_.exchange(kUnlocked, std::memory_order::release) == kContended) {
    twist::ed::futex::WakeOne(wake_key);
  }
}

}  // namespace eventual::threads::lockfull::stdlike
