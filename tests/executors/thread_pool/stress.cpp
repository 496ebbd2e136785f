#include <eventual/executors/thread_pool.hpp>
#include <eventual/executors/submit.hpp>

#include <eventual/threads/lockfull/wait_group.hpp>

#include <twist/test/with/wheels/stress.hpp>

#include <twist/test/repeat.hpp>

#include <fmt/core.h>

using namespace eventual;  // NOLINT

namespace tests {

////////////////////////////////////////////////////////////////////////////////

void TestSeries() {
  executors::ThreadPool pool{1};

  pool.Start();

  for (twist::test::Repeat repeat; repeat();) {
    const size_t tasks = 1 + repeat.Iter() % 3;

    threads::lockfull::WaitGroup wg;
    wg.Add(tasks);

    for (size_t i = 0; i < tasks; ++i) {
      executors::Submit(pool, [&] {
        wg.Done();
      });
    }

    wg.Wait();
  }

  pool.Stop();
}

////////////////////////////////////////////////////////////////////////////////

void TestCurrent() {
  executors::ThreadPool pool{2};

  pool.Start();

  twist::test::Repeat repeat;

  while (repeat()) {
    threads::lockfull::WaitGroup wg;
    wg.Add(1);

    executors::Submit(pool, [&] {
      executors::Submit(*executors::ThreadPool::Current(), [&] {
        wg.Done();
      });
    });

    wg.Wait();
  }

  pool.Stop();

  fmt::println("Iterations: {}", repeat.IterCount());
}

}  // namespace tests

////////////////////////////////////////////////////////////////////////////////

TEST_SUITE(ThreadPool) {
  TWIST_TEST(Series, 5s) {
    tests::TestSeries();
  }

  TWIST_TEST(Current, 5s) {
    tests::TestCurrent();
  }
}

RUN_ALL_TESTS()
