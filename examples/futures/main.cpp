#include <eventual/executors/thread_pool.hpp>

#include <eventual/futures/make/contract.hpp>
#include <eventual/futures/make/failure.hpp>
#include <eventual/futures/make/never.hpp>
#include <eventual/futures/make/submit.hpp>
#include <eventual/futures/make/value.hpp>

#include <eventual/futures/combine/seq/filter.hpp>
#include <eventual/futures/combine/seq/flat_map.hpp>
#include <eventual/futures/combine/seq/handle.hpp>
#include <eventual/futures/combine/seq/map.hpp>
#include <eventual/futures/combine/seq/on_success.hpp>
#include <eventual/futures/combine/seq/rescue.hpp>
#include <eventual/futures/combine/seq/via.hpp>
#include <eventual/futures/combine/seq/with_timeout.hpp>

#include <eventual/futures/syntax/both.hpp>
#include <eventual/futures/syntax/or.hpp>

#include <eventual/futures/run/await.hpp>

#include <eventual/timers/processors/standalone.hpp>

#include <fmt/core.h>

#include <chrono>
#include <string>

using namespace eventual;  // NOLINT

using namespace std::chrono_literals;

//////////////////////////////////////////////////////////////////////

// Future represents a result of a (potentially) asynchronous operation

// Futures are eager: the producer is submitted to the executor
// as soon as the future is created

// Completed futures hold Try<T>: either a value or an Error.
// Errors travel through the pipeline the same way values do,
// only Rescue and Handle turn them back into values

//////////////////////////////////////////////////////////////////////

void SubmitExample(executors::ThreadPool& pool) {
  fmt::println("Submit example");

  auto f = futures::Submit(pool, [] {
    fmt::println("Running on thread pool");
    return 42;
  });

  auto r = f | futures::Await();

  fmt::println("Result: {}", *r);
}

//////////////////////////////////////////////////////////////////////

void ContractExample(executors::ThreadPool& pool) {
  fmt::println("Contract example");

  auto [f, p] = futures::Contract<std::string>(pool);

  f.Respond([](const Try<std::string>& r) {
    fmt::println("Got '{}'", *r);
  });

  p.SetValue("Hello");

  pool.WaitIdle();
}

//////////////////////////////////////////////////////////////////////

void PipelineExample(executors::ThreadPool& pool) {
  fmt::println("Pipeline example");

  auto r = futures::Value(pool, 1) | futures::Map([](int v) {
             return v + 1;
           }) |
           futures::FlatMap([&pool](int v) {
             return futures::Submit(pool, [v] {
               return v * 10;
             });
           }) |
           futures::Filter([](int v) {
             return v > 100;
           }) |
           futures::OnFailure([](const Error& e) {
             fmt::println("Filtered out: {}", e.Message());
           }) |
           futures::Handle([](const Error&) {
             return 0;
           }) |
           futures::Await();

  fmt::println("Result: {}", *r);
}

//////////////////////////////////////////////////////////////////////

void RescueExample(executors::ThreadPool& pool) {
  fmt::println("Rescue example");

  auto r = futures::Failure<int>(pool, Errc::TimedOut) |
           futures::Rescue([&pool](const Error& e) {
             fmt::println("Recovering from '{}'", e.Message());
             return futures::Value(pool, 7);
           }) |
           futures::Await();

  fmt::println("Result: {}", *r);
}

//////////////////////////////////////////////////////////////////////

void ParallelExample(executors::ThreadPool& pool) {
  fmt::println("Join / Or example");

  auto both = futures::Value(pool, 1) + futures::Value(pool, std::string("x"));

  auto [x, y] = *(both | futures::Await());

  fmt::println("Both: ({}, {})", x, y);

  auto race = futures::Never<int>(pool) || futures::Value(pool, 2.5);

  auto winner = *(race | futures::Await());

  fmt::println("Right won: {}", winner.Right());
}

//////////////////////////////////////////////////////////////////////

void TimeoutExample(executors::ThreadPool& pool) {
  fmt::println("Timeout example");

  timers::StandaloneProcessor proc{};

  auto r = futures::Never<int>(pool) |
           futures::WithTimeout(proc.DelayFromThis(100ms), pool) |
           futures::Await();

  fmt::println("Timed out: {}", r.GetError().Message());

  proc.Metrics().Print();
}

//////////////////////////////////////////////////////////////////////

void ViaExample(executors::ThreadPool& pool) {
  fmt::println("Via example");

  executors::ThreadPool other{1};
  other.Start();

  auto r = futures::Value(pool, 3) | futures::Via(other) |
           futures::Map([&other](int v) {
             fmt::println("Running on other pool: {}",
                          executors::ThreadPool::Current() == &other);
             return v;
           }) |
           futures::Await();

  fmt::println("Result: {}", *r);

  other.WaitIdle();
  other.Stop();
}

//////////////////////////////////////////////////////////////////////

int main() {
  executors::ThreadPool pool{4};
  pool.Start();

  SubmitExample(pool);
  ContractExample(pool);
  PipelineExample(pool);
  RescueExample(pool);
  ParallelExample(pool);
  TimeoutExample(pool);
  ViaExample(pool);

  pool.WaitIdle();

  pool.Metrics().Print();

  pool.Stop();

  return 0;
}
