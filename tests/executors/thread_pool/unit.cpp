#include <eventual/executors/thread_pool.hpp>
#include <eventual/executors/submit.hpp>

#include <eventual/threads/lockfull/wait_group.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/atomic.hpp>

#include <algorithm>
#include <string>

using namespace eventual;  // NOLINT

TEST_SUITE(ThreadPool) {
  SIMPLE_TEST(JustWorks) {
    executors::ThreadPool pool{4};

    pool.Start();

    threads::lockfull::WaitGroup wg;
    wg.Add(1);

    executors::Submit(pool, [&] {
      wg.Done();
    });

    wg.Wait();

    pool.Stop();
  }

  SIMPLE_TEST(WaitIdle) {
    executors::ThreadPool pool{4};

    pool.Start();

    twist::ed::stdlike::atomic<size_t> tasks{0};

    for (size_t i = 0; i < 100; ++i) {
      executors::Submit(pool, [&] {
        tasks.fetch_add(1);
      });
    }

    pool.WaitIdle();

    ASSERT_EQ(tasks.load(), 100);

    pool.Stop();
  }

  SIMPLE_TEST(Current) {
    executors::ThreadPool pool{1};

    pool.Start();

    ASSERT_TRUE(executors::ThreadPool::Current() == nullptr);

    executors::Submit(pool, [&] {
      ASSERT_TRUE(executors::ThreadPool::Current() == &pool);
    });

    pool.WaitIdle();
    pool.Stop();
  }

  SIMPLE_TEST(SubmitFromTask) {
    executors::ThreadPool pool{2};

    pool.Start();

    twist::ed::stdlike::atomic<bool> done{false};

    executors::Submit(pool, [&] {
      executors::Submit(*executors::ThreadPool::Current(), [&] {
        done.store(true);
      });
    });

    pool.WaitIdle();

    ASSERT_TRUE(done.load());

    pool.Stop();
  }

  SIMPLE_TEST(Metrics) {
    executors::ThreadPool pool{3};

    pool.Start();

    for (size_t i = 0; i < 10; ++i) {
      executors::Submit(pool, [] {});
    }

    pool.WaitIdle();
    pool.Stop();

    auto data = pool.Metrics().Data();

    ASSERT_EQ(data.size(), 2);

    for (const auto& [name, count] : data) {
      ASSERT_TRUE(name == "tasks.submitted" || name == "tasks.completed");
      ASSERT_EQ(count, 10);
    }
  }
}

RUN_ALL_TESTS()
