#include <eventual/threads/blocking/event.hpp>
#include <eventual/threads/lockfull/wait_group.hpp>
#include <eventual/threads/lockfull/stdlike/mutex.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <mutex>
#include <vector>

using namespace eventual;  // NOLINT

TEST_SUITE(Blocking) {
  SIMPLE_TEST(Event) {
    threads::blocking::Event event;

    bool ready = false;

    twist::ed::stdlike::thread producer([&] {
      ready = true;
      event.Set();
    });

    event.Wait();

    ASSERT_TRUE(ready);

    producer.join();
  }

  SIMPLE_TEST(WaitGroupCounts) {
    threads::lockfull::WaitGroup wg;

    wg.Add(128);

    for (size_t i = 0; i < 128; ++i) {
      wg.Done();
    }

    wg.Wait();
  }

  SIMPLE_TEST(WaitGroupReuse) {
    threads::lockfull::WaitGroup wg;

    for (size_t round = 0; round < 3; ++round) {
      wg.Add(2);

      twist::ed::stdlike::thread t1([&] {
        wg.Done();
      });
      twist::ed::stdlike::thread t2([&] {
        wg.Done();
      });

      wg.Wait();

      t1.join();
      t2.join();
    }
  }

  SIMPLE_TEST(Mutex) {
    threads::lockfull::stdlike::Mutex mutex;

    size_t counter = 0;

    std::vector<twist::ed::stdlike::thread> threads;

    for (size_t t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
        for (size_t i = 0; i < 1000; ++i) {
          std::lock_guard guard(mutex);
          ++counter;
        }
      });
    }

    for (auto& t : threads) {
      t.join();
    }

    ASSERT_EQ(counter, 4000);
  }
}

RUN_ALL_TESTS()
