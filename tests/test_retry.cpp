/**
 * @file test_retry.cpp
 * @brief Tests for retry_with_backoff: attempt budget, delays, exceptions.
 */
#include <gtest/gtest.h>

#include "fakes.hpp"
#include "retry.hpp"

using namespace wanwatch;
using namespace std::chrono_literals;
using wanwatch::fakes::RecordingSleeper;

TEST(Retry, SucceedsOnThirdAttempt) {
  RecordingSleeper sleeper;
  int calls = 0;
  RetryPolicy policy{3, 100ms};
  auto out = retry_with_backoff([&] { return ++calls == 3; }, policy, sleeper.fn());
  EXPECT_TRUE(out.delivered);
  EXPECT_EQ(out.attempts, 3);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeper.delays.size(), 2u);
  EXPECT_EQ(sleeper.delays[0], 100ms);
  EXPECT_EQ(sleeper.delays[1], 200ms);
}

TEST(Retry, ExhaustedWithoutTrailingSleep) {
  RecordingSleeper sleeper;
  int calls = 0;
  RetryPolicy policy{3, 2000ms};
  auto out = retry_with_backoff([&] { ++calls; return false; }, policy, sleeper.fn());
  EXPECT_FALSE(out.delivered);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeper.delays.size(), 2u);
  EXPECT_EQ(sleeper.delays[0], 2000ms);
  EXPECT_EQ(sleeper.delays[1], 4000ms);
}

TEST(Retry, ImmediateSuccessNeverSleeps) {
  RecordingSleeper sleeper;
  auto out = retry_with_backoff([] { return true; }, RetryPolicy{}, sleeper.fn());
  EXPECT_TRUE(out.delivered);
  EXPECT_EQ(out.attempts, 1);
  EXPECT_TRUE(sleeper.delays.empty());
}

TEST(Retry, ExceptionCountsAsFailedAttempt) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto op = [&]() -> bool {
    if (++calls == 1) throw std::runtime_error("timeout");
    return true;
  };
  auto out = retry_with_backoff(op, RetryPolicy{3, 10ms}, sleeper.fn());
  EXPECT_TRUE(out.delivered);
  EXPECT_EQ(out.attempts, 2);
  EXPECT_EQ(sleeper.delays.size(), 1u);
}

TEST(Retry, BudgetBelowOneStillTriesOnce) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto out = retry_with_backoff([&] { ++calls; return false; }, RetryPolicy{0, 10ms}, sleeper.fn());
  EXPECT_FALSE(out.delivered);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper.delays.empty());
}

TEST(Retry, BackoffDoubles) {
  RetryPolicy p{5, 2000ms};
  EXPECT_EQ(backoff_delay(p, 0), 2000ms);
  EXPECT_EQ(backoff_delay(p, 1), 4000ms);
  EXPECT_EQ(backoff_delay(p, 3), 16000ms);
}
