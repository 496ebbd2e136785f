#include <eventual/executors/thread_pool.hpp>

#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/make/never.hpp>
#include <eventual/futures/make/submit.hpp>

#include <eventual/futures/combine/seq/map.hpp>
#include <eventual/futures/combine/seq/with_timeout.hpp>

#include <eventual/futures/run/await.hpp>

#include <eventual/result/errors/timeout.hpp>

#include <eventual/timers/processors/standalone.hpp>
#include <eventual/timers/submit_after.hpp>

#include <eventual/satellite/satellite.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/atomic.hpp>

#include <chrono>
#include <thread>

using namespace eventual;  // NOLINT
using namespace std::chrono_literals;

TEST_SUITE(WithTimeout) {
  SIMPLE_TEST(SourceFirst) {
    executors::ThreadPool pool{2};
    pool.Start();

    timers::StandaloneProcessor proc{};

    auto [f, p] = futures::Contract<int>(pool);

    timers::SubmitAfter(proc.DelayFromThis(50ms), pool, [p] {
      p.SetValue(42);
    });

    auto r = f | futures::WithTimeout(proc.DelayFromThis(100ms), pool) |
             futures::Await();

    ASSERT_TRUE(r.IsSuccess());
    ASSERT_EQ(*r, 42);

    pool.WaitIdle();
    pool.Stop();
  }

  SIMPLE_TEST(Never) {
    executors::ThreadPool pool{2};
    pool.Start();

    timers::StandaloneProcessor proc{};

    twist::ed::stdlike::atomic<size_t> callbacks{0};

    auto start = TimeoutError::Clock::now();

    auto f = futures::Never<int>(pool) |
             futures::WithTimeout(proc.DelayFromThis(100ms), pool);

    f.Respond([&](const Try<int>&) {
      callbacks.fetch_add(1);
    });

    auto r = f | futures::Await();

    ASSERT_GE(TimeoutError::Clock::now() - start, 100ms);

    ASSERT_TRUE(r.IsFailure());
    ASSERT_TRUE(r.GetError() == Errc::TimedOut);

    const auto* timeout = r.GetError().As<TimeoutError>();
    ASSERT_TRUE(timeout != nullptr);
    ASSERT_GE(timeout->Deadline() - start, 100ms);

    std::this_thread::sleep_for(100ms);
    pool.WaitIdle();

    ASSERT_EQ(callbacks.load(), 1);

    pool.Stop();
  }

  SIMPLE_TEST(LateSourceIsDropped) {
    executors::ThreadPool pool{2};
    pool.Start();

    timers::StandaloneProcessor proc{};

    auto [f, p] = futures::Contract<int>(pool);

    twist::ed::stdlike::atomic<size_t> callbacks{0};

    auto g = f | futures::WithTimeout(proc.DelayFromThis(30ms), pool);

    g.Respond([&](const Try<int>&) {
      callbacks.fetch_add(1);
    });

    auto r = g | futures::Await();

    ASSERT_TRUE(r.GetError() == Errc::TimedOut);

    // Source completes after the deadline
    ASSERT_TRUE(p.SetValue(7));

    pool.WaitIdle();

    ASSERT_TRUE(g.Peek()->GetError() == Errc::TimedOut);
    ASSERT_EQ(callbacks.load(), 1);

    pool.Stop();
  }

  SIMPLE_TEST(TimerCancelled) {
    executors::ThreadPool pool{2};
    pool.Start();

    timers::StandaloneProcessor proc{};

    auto r = futures::Submit(pool, [] {
               return 1;
             }) |
             futures::WithTimeout(proc.DelayFromThis(50ms), pool) |
             futures::Map([](int v) {
               return v + 1;
             }) |
             futures::Await();

    ASSERT_EQ(*r, 2);

    std::this_thread::sleep_for(100ms);

    size_t fired = 0;
    for (const auto& [name, count] : proc.Metrics().Data()) {
      if (name == "timers.fired") {
        fired = count;
      }
    }

    ASSERT_EQ(fired, 0);

    pool.WaitIdle();
    pool.Stop();
  }

  SIMPLE_TEST(GlobalProcessor) {
    executors::ThreadPool pool{1};
    pool.Start();

    timers::StandaloneProcessor proc{};
    proc.MakeGlobal();

    auto r = futures::Never<int>(pool) | futures::WithTimeout(20ms, pool) |
             futures::Await();

    ASSERT_TRUE(r.GetError() == Errc::TimedOut);

    satellite::ResetGlobalProcessor();

    pool.WaitIdle();
    pool.Stop();
  }
}

RUN_ALL_TESTS()
