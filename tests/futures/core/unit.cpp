#include <eventual/executors/manual.hpp>

#include <eventual/futures/types/future.hpp>

#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/make/failure.hpp>
#include <eventual/futures/make/just.hpp>
#include <eventual/futures/make/never.hpp>
#include <eventual/futures/make/ready.hpp>
#include <eventual/futures/make/submit.hpp>
#include <eventual/futures/make/value.hpp>

#include <eventual/futures/combine/seq/on_success.hpp>

#include <eventual/result/make/err.hpp>
#include <eventual/result/make/ok.hpp>

#include <wheels/test/framework.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace eventual;  // NOLINT

//////////////////////////////////////////////////////////////////////

static Error TestError() {
  return std::make_error_code(std::errc::invalid_argument);
}

//////////////////////////////////////////////////////////////////////

TEST_SUITE(Future) {
  SIMPLE_TEST(ProducerRunsOnExecutor) {
    executors::ManualExecutor manual;

    bool produced = false;

    futures::Future<int> f(manual, [&](futures::Promise<int> p) {
      produced = true;
      p.SetValue(42);
    });

    ASSERT_FALSE(produced);
    ASSERT_FALSE(f.IsReady());

    manual.Drain();

    ASSERT_TRUE(produced);
    ASSERT_TRUE(f.IsReady());
    ASSERT_EQ(**f.Peek(), 42);
  }

  SIMPLE_TEST(RespondBeforeAndAfter) {
    executors::ManualExecutor manual;

    auto f = futures::Value(manual, 42);

    std::optional<Try<int>> before;
    std::optional<Try<int>> after;

    f.Respond([&](const Try<int>& r) {
      before.emplace(r);
    });

    manual.Drain();

    ASSERT_TRUE(before.has_value());
    ASSERT_EQ(**before, 42);

    f.Respond([&](const Try<int>& r) {
      after.emplace(r);
    });

    // Dispatched through the executor
    ASSERT_FALSE(after.has_value());

    manual.Drain();

    ASSERT_TRUE(after.has_value());
    ASSERT_EQ(**after, 42);
  }

  SIMPLE_TEST(ObserversInRegistrationOrder) {
    executors::ManualExecutor manual;

    auto [f, p] = futures::Contract<int>(manual);

    std::vector<int> calls;

    f.Respond([&](const Try<int>&) {
       calls.push_back(1);
     })
        .Respond([&](const Try<int>&) {
          calls.push_back(2);
        })
        .Respond([&](const Try<int>&) {
          calls.push_back(3);
        });

    manual.Drain();
    ASSERT_TRUE(calls.empty());

    p.SetValue(42);
    manual.Drain();

    ASSERT_EQ(calls.size(), 3);
    ASSERT_EQ(calls[0], 1);
    ASSERT_EQ(calls[1], 2);
    ASSERT_EQ(calls[2], 3);

    // Exactly once
    manual.Drain();
    ASSERT_EQ(calls.size(), 3);
  }

  SIMPLE_TEST(FirstSetWins) {
    executors::ManualExecutor manual;

    auto [f, p] = futures::Contract<int>(manual);

    ASSERT_FALSE(p.IsCompleted());

    ASSERT_TRUE(p.SetValue(1));
    ASSERT_FALSE(p.SetValue(2));
    ASSERT_FALSE(p.SetError(TestError()));

    ASSERT_TRUE(p.IsCompleted());

    std::vector<int> values;

    for (size_t i = 0; i < 3; ++i) {
      f.Respond([&](const Try<int>& r) {
        values.push_back(*r);
      });
    }

    manual.Drain();

    ASSERT_EQ(values.size(), 3);
    for (int v : values) {
      ASSERT_EQ(v, 1);
    }
  }

  SIMPLE_TEST(Failure) {
    executors::ManualExecutor manual;

    auto f = futures::Failure<int>(manual, TestError());

    manual.Drain();

    ASSERT_TRUE(f.Peek()->GetError() == TestError());
  }

  SIMPLE_TEST(Ready) {
    executors::ManualExecutor manual;

    auto f = futures::Ready(manual, result::Ok(std::string("ready")));

    // Completes through the executor
    ASSERT_FALSE(f.IsReady());

    manual.Drain();

    ASSERT_EQ(**f.Peek(), "ready");
  }

  SIMPLE_TEST(Just) {
    executors::ManualExecutor manual;

    auto f = futures::Just(manual);

    manual.Drain();

    ASSERT_TRUE(f.Peek()->IsSuccess());
  }

  SIMPLE_TEST(Submit) {
    executors::ManualExecutor manual;

    auto f = futures::Submit(manual, [] {
      return 7;
    });

    auto g = futures::Submit(manual, [] {});

    auto h = futures::Submit(manual, []() -> Try<int> {
      return result::Err(Errc::TimedOut);
    });

    manual.Drain();

    ASSERT_EQ(**f.Peek(), 7);
    ASSERT_TRUE(g.Peek()->IsSuccess());
    ASSERT_TRUE(h.Peek()->GetError() == Errc::TimedOut);
  }

  SIMPLE_TEST(ThrowingProducer) {
    executors::ManualExecutor manual;

    futures::Future<int> f(manual, [](futures::Promise<int>) {
      throw std::runtime_error("boom");
    });

    manual.Drain();

    auto r = *f.Peek();

    ASSERT_TRUE(r.IsFailure());
    ASSERT_TRUE(r.GetError().As<std::runtime_error>() != nullptr);
    ASSERT_EQ(r.GetError().Message(), "boom");
  }

  SIMPLE_TEST(BrokenPromise) {
    executors::ManualExecutor manual;

    futures::Future<int> f(manual, [](futures::Promise<int>) {
      // Drop the promise
    });

    manual.Drain();

    ASSERT_TRUE(f.Peek()->GetError() == Errc::BrokenPromise);
  }

  SIMPLE_TEST(PromiseCopies) {
    executors::ManualExecutor manual;

    std::optional<futures::Promise<int>> stored;

    futures::Future<int> f(manual, [&](futures::Promise<int> p) {
      stored.emplace(p);
    });

    manual.Drain();

    // A copy is still alive
    ASSERT_FALSE(f.IsReady());

    stored->SetValue(5);

    ASSERT_EQ(**f.Peek(), 5);
  }

  SIMPLE_TEST(Never) {
    executors::ManualExecutor manual;

    auto f = futures::Never<int>(manual);

    bool called = false;

    f.Respond([&](const Try<int>&) {
      called = true;
    });

    manual.Drain();

    ASSERT_FALSE(called);
    ASSERT_FALSE(f.Peek().has_value());
  }

  SIMPLE_TEST(SideEffects) {
    executors::ManualExecutor manual;

    int value = 0;
    bool failed = false;

    futures::Value(manual, 3) | futures::OnSuccess([&](int v) {
      value = v;
    }) | futures::OnFailure([&](const Error&) {
      failed = true;
    });

    futures::Failure<int>(manual, TestError()) | futures::OnFailure([&](const Error&) {
      failed = true;
    }) | futures::Foreach([&](int) {
      value = -1;
    });

    manual.Drain();

    ASSERT_EQ(value, 3);
    ASSERT_TRUE(failed);
  }

  SIMPLE_TEST(Executor) {
    executors::ManualExecutor manual;

    auto f = futures::Never<int>(manual);

    ASSERT_TRUE(&f.Executor() == &manual);
  }
}

RUN_ALL_TESTS()
