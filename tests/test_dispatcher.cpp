#include "bluos/dispatcher.h"

#include "fakes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace bluos;
using namespace bluos::test;

namespace
{

std::vector<Device> devices(int n)
{
  std::vector<Device> out;
  for (int i = 0; i < n; i++)
    out.push_back(make_device("192.168.1." + std::to_string(10 + i), "Player " + std::to_string(i)));
  return out;
}

} // namespace

TEST(Dispatcher, EveryDeviceGetsOneOutcome)
{
  Dispatcher dispatcher;
  std::function<std::string(const Device &)> op = [](const Device &d) { return d.name; };

  std::map<std::string, CommandOutcome> outcomes = dispatcher.dispatch<std::string>(devices(5), OperationClass::Command, op);

  ASSERT_EQ(5u, outcomes.size());
  for (const auto &pair : outcomes)
  {
    EXPECT_TRUE(pair.second.ok);
    EXPECT_EQ(pair.second.device.name, pair.second.value.value());
    EXPECT_EQ(pair.first, pair.second.device.address);
    EXPECT_EQ(1, pair.second.attempts);
  }
}

TEST(Dispatcher, FailureIsIsolated)
{
  Dispatcher dispatcher;
  std::function<int(const Device &, int &)> op = [](const Device &d, int &attempts) {
    attempts = 2;
    if (d.address == "192.168.1.11")
    {
      TransportError e(ErrorKind::Timeout, "timed out", d.address);
      e.attempts = 3;
      throw e;
    }
    return 7;
  };

  std::map<std::string, Outcome<int>> outcomes = dispatcher.dispatch<int>(devices(3), OperationClass::Command, op);

  ASSERT_EQ(3u, outcomes.size());
  EXPECT_TRUE(outcomes.at("192.168.1.10").ok);
  EXPECT_EQ(2, outcomes.at("192.168.1.10").attempts);
  EXPECT_TRUE(outcomes.at("192.168.1.12").ok);

  const Outcome<int> &failed = outcomes.at("192.168.1.11");
  EXPECT_FALSE(failed.ok);
  EXPECT_FALSE(failed.value.has_value());
  EXPECT_EQ(ErrorKind::Timeout, failed.error.kind);
  EXPECT_EQ("timed out", failed.error.message);
  EXPECT_EQ(3, failed.attempts);
}

TEST(Dispatcher, ForeignExceptionBecomesDeviceError)
{
  Dispatcher dispatcher;
  std::function<int(const Device &)> op = [](const Device &) -> int { throw std::out_of_range("boom"); };

  std::map<std::string, Outcome<int>> outcomes = dispatcher.dispatch<int>(devices(1), OperationClass::Command, op);
  EXPECT_FALSE(outcomes.begin()->second.ok);
  EXPECT_EQ(ErrorKind::Device, outcomes.begin()->second.error.kind);
}

TEST(Dispatcher, EmptySetIsRejected)
{
  Dispatcher dispatcher;
  std::function<int(const Device &)> op = [](const Device &) { return 1; };
  EXPECT_THROW(dispatcher.dispatch<int>({}, OperationClass::Command, op), ValidationError);
}

TEST(Dispatcher, DuplicateAddressesRunOnce)
{
  Dispatcher dispatcher;
  std::atomic<int> calls{0};
  std::function<int(const Device &)> op = [&calls](const Device &) { return ++calls; };

  std::vector<Device> set = {make_device("192.168.1.10", "A"), make_device("192.168.1.10", "B")};
  std::map<std::string, Outcome<int>> outcomes = dispatcher.dispatch<int>(set, OperationClass::Command, op);

  EXPECT_EQ(1u, outcomes.size());
  EXPECT_EQ(1, calls.load());
  EXPECT_EQ("A", outcomes.at("192.168.1.10").device.name);
}

TEST(Dispatcher, PoolIsBoundedByCeilingAndDeviceCount)
{
  Dispatcher dispatcher(10, 20);
  EXPECT_EQ(10u, dispatcher.ceiling(OperationClass::Discovery));
  EXPECT_EQ(20u, dispatcher.ceiling(OperationClass::Command));
  EXPECT_EQ(3u, dispatcher.pool_size(OperationClass::Command, 3));
  EXPECT_EQ(20u, dispatcher.pool_size(OperationClass::Command, 50));
  EXPECT_EQ(10u, dispatcher.pool_size(OperationClass::Discovery, 50));
  EXPECT_EQ(1u, dispatcher.pool_size(OperationClass::Command, 0));
}

TEST(Dispatcher, RunsInParallel)
{
  Dispatcher dispatcher;
  std::function<int(const Device &)> op = [](const Device &) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return 1;
  };

  auto start = std::chrono::steady_clock::now();
  std::map<std::string, Outcome<int>> outcomes = dispatcher.dispatch<int>(devices(10), OperationClass::Command, op);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(10u, outcomes.size());
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
  for (const auto &pair : outcomes)
    EXPECT_GE(pair.second.elapsed, std::chrono::milliseconds(200));
}
