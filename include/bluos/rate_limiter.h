#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace bluos
{

static const std::chrono::milliseconds DEFAULT_RATE_LIMIT_INTERVAL(100);

// Minimum spacing between calls to one device. Each caller reserves the
// next free slot under the lock, then sleeps outside it, so concurrent
// callers for the same device are serialized and different devices never
// wait on each other.
class RateLimiter
{
public:
  typedef std::function<void(std::chrono::steady_clock::duration)> Sleeper;

  explicit RateLimiter(std::chrono::milliseconds interval = DEFAULT_RATE_LIMIT_INTERVAL,
                       Sleeper sleeper = Sleeper());

  // Returns the time spent waiting.
  std::chrono::steady_clock::duration wait_if_needed(const std::string &address);

  void reset(const std::string &address);
  void reset_all();

  std::chrono::milliseconds interval() const { return interval_; }

private:
  std::chrono::milliseconds interval_;
  Sleeper sleeper_;
  std::mutex mutex_;
  std::map<std::string, std::chrono::steady_clock::time_point> next_slot_;
};

} // namespace bluos
