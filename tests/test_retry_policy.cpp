#include "bluos/retry_policy.h"

#include <gtest/gtest.h>

using namespace bluos;

TEST(RetryPolicy, DelayDoublesUpToCeiling)
{
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(1000);
  policy.max_delay = std::chrono::milliseconds(10000);

  EXPECT_EQ(std::chrono::milliseconds(0), policy.delay_before(0));
  EXPECT_EQ(std::chrono::milliseconds(1000), policy.delay_before(1));
  EXPECT_EQ(std::chrono::milliseconds(2000), policy.delay_before(2));
  EXPECT_EQ(std::chrono::milliseconds(4000), policy.delay_before(3));
  EXPECT_EQ(std::chrono::milliseconds(8000), policy.delay_before(4));
  EXPECT_EQ(std::chrono::milliseconds(10000), policy.delay_before(5));
  EXPECT_EQ(std::chrono::milliseconds(10000), policy.delay_before(500));
}

TEST(RetryPolicy, DelaysNeverDecrease)
{
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(300);
  policy.max_delay = std::chrono::milliseconds(5000);
  for (int n = 1; n < 40; n++)
    EXPECT_LE(policy.delay_before(n), policy.delay_before(n + 1));
}

TEST(RetryPolicy, DefaultRetryableKinds)
{
  RetryPolicy policy;
  EXPECT_TRUE(policy.is_retryable(ErrorKind::Timeout));
  EXPECT_TRUE(policy.is_retryable(ErrorKind::ConnectionFailed));
  EXPECT_TRUE(policy.is_retryable(ErrorKind::ServerError));
  EXPECT_FALSE(policy.is_retryable(ErrorKind::Device));
  EXPECT_FALSE(policy.is_retryable(ErrorKind::Validation));
  EXPECT_FALSE(policy.is_retryable(ErrorKind::Protocol));
}

TEST(RetryState, RetriesUntilAttemptsRunOut)
{
  RetryPolicy policy;
  policy.max_attempts = 3;
  RetryState state(policy);

  ASSERT_TRUE(state.begin_attempt());
  EXPECT_EQ(std::chrono::milliseconds(1000), state.on_failure(ErrorKind::Timeout).value());
  ASSERT_TRUE(state.begin_attempt());
  EXPECT_EQ(std::chrono::milliseconds(2000), state.on_failure(ErrorKind::Timeout).value());
  ASSERT_TRUE(state.begin_attempt());
  EXPECT_FALSE(state.on_failure(ErrorKind::Timeout).has_value());

  EXPECT_EQ(RetryState::Phase::Failed, state.phase());
  EXPECT_FALSE(state.begin_attempt());
  EXPECT_EQ(3, state.attempts());
}

TEST(RetryState, SuccessStopsRetrying)
{
  RetryPolicy policy;
  RetryState state(policy);
  ASSERT_TRUE(state.begin_attempt());
  state.on_success();
  EXPECT_EQ(RetryState::Phase::Succeeded, state.phase());
  EXPECT_FALSE(state.begin_attempt());
  EXPECT_EQ(1, state.attempts());
}

TEST(RetryState, PermanentErrorIsNotRetried)
{
  RetryPolicy policy;
  RetryState state(policy);
  ASSERT_TRUE(state.begin_attempt());
  EXPECT_FALSE(state.on_failure(ErrorKind::Device).has_value());
  EXPECT_EQ(1, state.attempts());
}

TEST(RetryState, NonIdempotentCallIsNotRetried)
{
  RetryPolicy policy;
  RetryState state(policy, false);
  ASSERT_TRUE(state.begin_attempt());
  EXPECT_FALSE(state.on_failure(ErrorKind::Timeout).has_value());
  EXPECT_EQ(RetryState::Phase::Failed, state.phase());
}

namespace
{

struct FakeClock
{
  std::chrono::steady_clock::time_point now;

  CircuitBreaker::Clock fn()
  {
    return [this] { return now; };
  }
};

} // namespace

TEST(CircuitBreaker, DisabledAtZeroThreshold)
{
  CircuitBreaker breaker(0);
  for (int i = 0; i < 10; i++)
    breaker.record_failure("192.168.1.20");
  EXPECT_FALSE(breaker.enabled());
  EXPECT_TRUE(breaker.allow("192.168.1.20"));
  EXPECT_FALSE(breaker.is_open("192.168.1.20"));
}

TEST(CircuitBreaker, OpensAfterConsecutiveFailures)
{
  FakeClock clock;
  CircuitBreaker breaker(3, std::chrono::seconds(30), clock.fn());

  breaker.record_failure("192.168.1.20");
  breaker.record_failure("192.168.1.20");
  EXPECT_TRUE(breaker.allow("192.168.1.20"));
  breaker.record_failure("192.168.1.20");

  EXPECT_TRUE(breaker.is_open("192.168.1.20"));
  EXPECT_FALSE(breaker.allow("192.168.1.20"));
  EXPECT_TRUE(breaker.allow("192.168.1.21"));
}

TEST(CircuitBreaker, SuccessResetsCount)
{
  FakeClock clock;
  CircuitBreaker breaker(2, std::chrono::seconds(30), clock.fn());
  breaker.record_failure("192.168.1.20");
  breaker.record_success("192.168.1.20");
  breaker.record_failure("192.168.1.20");
  EXPECT_FALSE(breaker.is_open("192.168.1.20"));
}

TEST(CircuitBreaker, HalfOpenAfterCooldown)
{
  FakeClock clock;
  CircuitBreaker breaker(1, std::chrono::seconds(30), clock.fn());
  breaker.record_failure("192.168.1.20");
  EXPECT_FALSE(breaker.allow("192.168.1.20"));

  clock.now += std::chrono::seconds(30);
  EXPECT_TRUE(breaker.allow("192.168.1.20"));
  EXPECT_FALSE(breaker.allow("192.168.1.20"));

  breaker.record_success("192.168.1.20");
  EXPECT_TRUE(breaker.allow("192.168.1.20"));
}
