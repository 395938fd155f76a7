#include "bluos/rate_limiter.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace bluos;

TEST(RateLimiter, FirstCallDoesNotWait)
{
  int sleeps = 0;
  RateLimiter limiter(std::chrono::milliseconds(100), [&](std::chrono::steady_clock::duration) { sleeps++; });
  EXPECT_EQ(std::chrono::steady_clock::duration::zero(), limiter.wait_if_needed("192.168.1.20"));
  EXPECT_EQ(0, sleeps);
}

TEST(RateLimiter, SpacesCallsToOneDevice)
{
  RateLimiter limiter(std::chrono::milliseconds(20));
  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 10; i++)
    limiter.wait_if_needed("192.168.1.20");
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, std::chrono::milliseconds(180));
}

TEST(RateLimiter, ConcurrentCallersAreSerialized)
{
  RateLimiter limiter(std::chrono::milliseconds(20));
  auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> threads;
  for (int i = 0; i < 5; i++)
    threads.emplace_back([&] { limiter.wait_if_needed("192.168.1.20"); });
  for (auto &t : threads)
    t.join();

  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(80));
}

TEST(RateLimiter, DevicesAreIndependent)
{
  std::vector<std::chrono::steady_clock::duration> waits;
  RateLimiter limiter(std::chrono::milliseconds(1000),
                      [&](std::chrono::steady_clock::duration d) { waits.push_back(d); });

  limiter.wait_if_needed("192.168.1.20");
  limiter.wait_if_needed("192.168.1.21");
  limiter.wait_if_needed("192.168.1.22");
  EXPECT_TRUE(waits.empty());

  limiter.wait_if_needed("192.168.1.20");
  ASSERT_EQ(1u, waits.size());
  EXPECT_GT(waits[0], std::chrono::milliseconds(900));
}

TEST(RateLimiter, ResetForgetsDevice)
{
  int sleeps = 0;
  RateLimiter limiter(std::chrono::milliseconds(1000), [&](std::chrono::steady_clock::duration) { sleeps++; });
  limiter.wait_if_needed("192.168.1.20");
  limiter.reset("192.168.1.20");
  limiter.wait_if_needed("192.168.1.20");
  EXPECT_EQ(0, sleeps);

  limiter.wait_if_needed("192.168.1.21");
  limiter.reset_all();
  limiter.wait_if_needed("192.168.1.20");
  limiter.wait_if_needed("192.168.1.21");
  EXPECT_EQ(0, sleeps);
}

TEST(RateLimiter, ZeroIntervalNeverWaits)
{
  int sleeps = 0;
  RateLimiter limiter(std::chrono::milliseconds(0), [&](std::chrono::steady_clock::duration) { sleeps++; });
  for (int i = 0; i < 5; i++)
    limiter.wait_if_needed("192.168.1.20");
  EXPECT_EQ(0, sleeps);
}
