#pragma once

#include <eventual/timers/timer.hpp>

#include <eventual/threads/lockfull/spinlock.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace eventual::timers {

// Min-heap of timers ordered by deadline

class TimersQueue {
  using Clock = TimerBase::Clock;
  using TimerRef = std::shared_ptr<TimerBase>;

  struct LaterDeadline {
    bool operator()(const TimerRef& lhs, const TimerRef& rhs) const {
      return lhs->Deadline() > rhs->Deadline();
    }
  };

 public:
  struct Grabbed {
    std::vector<TimerRef> ready;
    // nullopt if no timers left
    std::optional<Clock::duration> until_next;
  };

  void Push(TimerRef timer) {
    std::lock_guard guard(spinlock_);

    heap_.push_back(std::move(timer));
    std::push_heap(heap_.begin(), heap_.end(), LaterDeadline{});
  }

  // Takes timers with passed deadlines and every cancelled one
  Grabbed GrabReady(Clock::time_point now) {
    Grabbed grabbed;

    std::lock_guard guard(spinlock_);

    RemoveCancelled(grabbed.ready);

    while (!heap_.empty()) {
      const TimerRef& top = heap_.front();

      if (top->Deadline() > now && !top->IsCancelled()) {
        grabbed.until_next = top->Deadline() - now;
        break;
      }

      std::pop_heap(heap_.begin(), heap_.end(), LaterDeadline{});
      grabbed.ready.push_back(std::move(heap_.back()));
      heap_.pop_back();
    }

    return grabbed;
  }

  std::vector<TimerRef> TakeAll() {
    std::lock_guard guard(spinlock_);

    return std::exchange(heap_, {});
  }

 private:
  void RemoveCancelled(std::vector<TimerRef>& out) {
    auto cancelled = std::partition(heap_.begin(), heap_.end(),
                                    [](const TimerRef& timer) {
                                      return !timer->IsCancelled();
                                    });

    if (cancelled == heap_.end()) {
      return;
    }

    std::move(cancelled, heap_.end(), std::back_inserter(out));
    heap_.erase(cancelled, heap_.end());

    std::make_heap(heap_.begin(), heap_.end(), LaterDeadline{});
  }

 private:
  threads::lockfull::SpinLock spinlock_{};
  std::vector<TimerRef> heap_{};  // guarded by spinlock_
};

}  // namespace eventual::timers
