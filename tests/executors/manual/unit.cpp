#include <eventual/executors/manual.hpp>
#include <eventual/executors/inline.hpp>
#include <eventual/executors/submit.hpp>

#include <wheels/test/framework.hpp>

#include <string>

using namespace eventual;  // NOLINT

TEST_SUITE(ManualExecutor) {
  SIMPLE_TEST(JustWorks) {
    executors::ManualExecutor manual;

    size_t step = 0;

    ASSERT_FALSE(manual.NonEmpty());
    ASSERT_FALSE(manual.RunNext());
    ASSERT_EQ(manual.RunAtMost(99), 0);

    executors::Submit(manual, [&] {
      step = 1;
    });

    ASSERT_TRUE(manual.NonEmpty());
    ASSERT_EQ(manual.TaskCount(), 1);

    ASSERT_EQ(step, 0);

    executors::Submit(manual, [&] {
      step = 2;
    });

    ASSERT_EQ(manual.TaskCount(), 2);

    ASSERT_EQ(step, 0);

    ASSERT_TRUE(manual.RunNext());

    ASSERT_EQ(step, 1);

    ASSERT_TRUE(manual.NonEmpty());
    ASSERT_EQ(manual.TaskCount(), 1);

    ASSERT_TRUE(manual.RunNext());

    ASSERT_EQ(step, 2);

    ASSERT_TRUE(manual.IsEmpty());
    ASSERT_FALSE(manual.RunNext());
  }

  SIMPLE_TEST(Fifo) {
    executors::ManualExecutor manual;

    std::string trace;

    for (char c = 'a'; c <= 'e'; ++c) {
      executors::Submit(manual, [&trace, c] {
        trace.push_back(c);
      });
    }

    ASSERT_EQ(manual.Drain(), 5);
    ASSERT_EQ(trace, "abcde");
  }

  class Looper {
   public:
    explicit Looper(executors::IExecutor& e, size_t iters)
        : executor_(e),
          iters_left_(iters) {
    }

    void Start() {
      Submit();
    }

    void Iter() {
      --iters_left_;
      if (iters_left_ > 0) {
        Submit();
      }
    }

   private:
    void Submit() {
      executors::Submit(executor_, [this] {
        Iter();
      });
    }

   private:
    executors::IExecutor& executor_;
    size_t iters_left_;
  };

  SIMPLE_TEST(RunAtMost) {
    executors::ManualExecutor manual;

    Looper looper{manual, 256};
    looper.Start();

    size_t tasks = 0;
    do {
      tasks += manual.RunAtMost(7);
    } while (manual.NonEmpty());

    ASSERT_EQ(tasks, 256);
  }

  SIMPLE_TEST(Drain) {
    executors::ManualExecutor manual;

    Looper looper{manual, 117};
    looper.Start();

    ASSERT_EQ(manual.Drain(), 117);
  }

  SIMPLE_TEST(Inline) {
    bool done = false;

    executors::Submit(executors::Inline(), [&] {
      done = true;
    });

    ASSERT_TRUE(done);
  }
}

RUN_ALL_TESTS()
