#include <eventual/threads/lockfull/guarded.hpp>
#include <eventual/threads/lockfree/counter.hpp>

#include <wheels/test/framework.hpp>

#include <twist/test/with/wheels/stress.hpp>
#include <twist/test/repeat.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <fmt/core.h>

#include <vector>

using namespace eventual;  // NOLINT

//////////////////////////////////////////////////////////////////////

void StressTestGuardedIncrements(size_t threads, size_t increments) {
  twist::test::Repeat repeat;

  while (repeat()) {
    threads::lockfull::Guarded<size_t> cell{0};
    threads::lockfree::AtomicCounter last{};

    size_t lasts = 0;

    std::vector<twist::ed::stdlike::thread> workers;

    for (size_t t = 0; t < threads; ++t) {
      workers.emplace_back([&] {
        for (size_t i = 0; i < increments; ++i) {
          cell.With([](size_t& value) {
            ++value;
          });
        }

        if (last.IncrementAndGet() == static_cast<int64_t>(threads)) {
          ++lasts;
          ASSERT_EQ(cell.Read(), threads * increments);
        }
      });
    }

    for (auto& w : workers) {
      w.join();
    }

    ASSERT_EQ(lasts, 1);
    ASSERT_EQ(cell.Read(), threads * increments);
  }

  fmt::println("Iterations: {}", repeat.IterCount());
}

//////////////////////////////////////////////////////////////////////

TEST_SUITE(Guarded) {
  TWIST_TEST(StressIncrements2, 5s) {
    StressTestGuardedIncrements(2, 100);
  }

  TWIST_TEST(StressIncrements4, 5s) {
    StressTestGuardedIncrements(4, 50);
  }
}

RUN_ALL_TESTS()
