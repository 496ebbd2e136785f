#include <eventual/timers/processors/standalone.hpp>

#include <twist/ed/wait/futex.hpp>

#include <algorithm>

namespace eventual::timers {

StandaloneProcessor::StandaloneProcessor()
    : logger_({"timers.added", "timers.fired", "timers.dropped"}, 1),
      metrics_(logger_.Shard(0)),
      worker_([this] {
        WorkerLoop();
      }) {
}

StandaloneProcessor::~StandaloneProcessor() {
  Stop();
}

void StandaloneProcessor::AddTimer(std::shared_ptr<TimerBase> timer) {
  metrics_->Increment("timers.added", 1);

  queue_.Push(std::move(timer));

  WakeWorker();
}

void StandaloneProcessor::WorkerLoop() {
  while (!stop_requested_.load(std::memory_order::acquire)) {
    // Read before polling: a timer pushed after the poll bumps wakeups_
    // and makes the wait below return immediately
    uint32_t epoch = wakeups_.load(std::memory_order::acquire);

    auto until_next_deadline = PollQueue();

    if (stop_requested_.load(std::memory_order::acquire)) {
      break;
    }

    if (until_next_deadline) {
      Millis sleep = std::max(
          kMinSleep, std::chrono::ceil<Millis>(*until_next_deadline));
      twist::ed::futex::WaitTimed(wakeups_, epoch, sleep);
    } else {
      twist::ed::futex::Wait(wakeups_, epoch, std::memory_order::acquire);
    }
  }

  DropAll();
}

std::optional<TimerBase::Clock::duration> StandaloneProcessor::PollQueue() {
  auto grabbed = queue_.GrabReady(TimerBase::Clock::now());

  for (auto& timer : grabbed.ready) {
    if (timer->TryClaim()) {
      metrics_->Increment("timers.fired", 1);
      timer->Fire();
    } else {
      metrics_->Increment("timers.dropped", 1);
    }
  }

  return grabbed.until_next;
}

void StandaloneProcessor::WakeWorker() {
  auto wake_key = twist::ed::futex::PrepareWake(wakeups_);
  wakeups_.fetch_add(1, std::memory_order::release);
  twist::ed::futex::WakeOne(wake_key);
}

// Only called by the worker on exit, AddTimer after Stop is a misuse
void StandaloneProcessor::DropAll() {
  for (auto& timer : queue_.TakeAll()) {
    timer->TryCancel();
    metrics_->Increment("timers.dropped", 1);
  }
}

void StandaloneProcessor::Stop() {
  stop_requested_.store(true, std::memory_order::release);
  WakeWorker();

  worker_.join();
}

}  // namespace eventual::timers
