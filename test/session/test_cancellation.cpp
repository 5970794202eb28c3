#include <chrono>
#include <stop_token>
#include <thread>
#include <gtest/gtest.h>
#include "kducer/common/errors.hpp"
#include "kducer/session/cancellation.hpp"

using kducer::Cancelled;
using kducer::CancellationScope;
using kducer::SleepFor;
using kducer::SleepUntil;
using kducer::ThrowIfCancelled;
using namespace std::chrono_literals;

TEST(Cancellation, ThrowIfCancelled) {
  std::stop_source source;
  EXPECT_NO_THROW(ThrowIfCancelled(source.get_token()));
  source.request_stop();
  EXPECT_THROW(ThrowIfCancelled(source.get_token()), Cancelled);
}

TEST(Cancellation, DefaultTokenNeverFires) {
  EXPECT_NO_THROW(ThrowIfCancelled(std::stop_token{}));
  EXPECT_NO_THROW(SleepFor(1ms, std::stop_token{}));
}

TEST(Cancellation, SleepRunsFullDuration) {
  std::stop_source source;
  const auto start = std::chrono::steady_clock::now();
  SleepFor(20ms, source.get_token());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(Cancellation, SleepThrowsWhenAlreadyStopped) {
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(SleepFor(1s, source.get_token()), Cancelled);
}

TEST(Cancellation, StopInterruptsSleep) {
  std::stop_source source;
  std::jthread stopper([&source] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(SleepFor(10s, source.get_token()), Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(Cancellation, SleepUntilPastDeadlineReturns) {
  std::stop_source source;
  EXPECT_NO_THROW(SleepUntil(std::chrono::steady_clock::now() - 1s, source.get_token()));
}

TEST(CancellationScope, ParentStopReachesScope) {
  std::stop_source parent;
  std::stop_source caller;
  CancellationScope scope(parent.get_token(), caller.get_token());
  EXPECT_FALSE(scope.IsCancelled());

  parent.request_stop();
  EXPECT_TRUE(scope.IsCancelled());
  EXPECT_TRUE(scope.GetToken().stop_requested());
  EXPECT_FALSE(caller.stop_requested());
}

TEST(CancellationScope, CallerStopDoesNotReachParent) {
  std::stop_source parent;
  std::stop_source caller;
  CancellationScope scope(parent.get_token(), caller.get_token());

  caller.request_stop();
  EXPECT_TRUE(scope.IsCancelled());
  EXPECT_FALSE(parent.stop_requested());
}

TEST(CancellationScope, SiblingScopesAreIsolated) {
  std::stop_source parent;
  std::stop_source first_caller;
  std::stop_source second_caller;
  CancellationScope first(parent.get_token(), first_caller.get_token());
  CancellationScope second(parent.get_token(), second_caller.get_token());

  first_caller.request_stop();
  EXPECT_TRUE(first.IsCancelled());
  EXPECT_FALSE(second.IsCancelled());

  parent.request_stop();
  EXPECT_TRUE(second.IsCancelled());
}

TEST(CancellationScope, AlreadyStoppedParent) {
  std::stop_source parent;
  parent.request_stop();
  CancellationScope scope(parent.get_token(), std::stop_token{});
  EXPECT_TRUE(scope.IsCancelled());
}
