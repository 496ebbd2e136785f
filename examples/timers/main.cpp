#include <eventual/executors/thread_pool.hpp>

#include <eventual/threads/lockfull/wait_group.hpp>

#include <eventual/timers/processors/standalone.hpp>
#include <eventual/timers/submit_after.hpp>

#include <fmt/core.h>

#include <chrono>

using namespace eventual;  // NOLINT

using namespace std::chrono_literals;

// Timers are submitted to a processor which sleeps until
// the nearest deadline and hands expired ones to their executors

//////////////////////////////////////////////////////////////////////

int main() {
  executors::ThreadPool pool{2};
  pool.Start();

  timers::StandaloneProcessor proc{};

  threads::lockfull::WaitGroup wg;
  wg.Add(2);

  timers::SubmitAfter(proc.DelayFromThis(200ms), pool, [&] {
    fmt::println("200ms timer expired");
    wg.Done();
  });

  timers::SubmitAfter(proc.DelayFromThis(100ms), pool, [&] {
    fmt::println("100ms timer expired");
    wg.Done();
  });

  // Cancelled timers never run
  auto handle = timers::SubmitAfter(proc.DelayFromThis(50ms), pool, [] {
    fmt::println("Unreachable");
  });

  fmt::println("Cancelled: {}", handle.Cancel());

  wg.Wait();

  proc.Metrics().Print();

  pool.WaitIdle();
  pool.Stop();

  return 0;
}
