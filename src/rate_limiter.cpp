#include "bluos/rate_limiter.h"

#include "log.h"

#include <algorithm>
#include <thread>

namespace bluos
{

RateLimiter::RateLimiter(std::chrono::milliseconds interval, Sleeper sleeper)
    : interval_(std::max(interval, std::chrono::milliseconds(0))),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::steady_clock::duration d) {
        std::this_thread::sleep_for(d);
      }))
{
}

std::chrono::steady_clock::duration RateLimiter::wait_if_needed(const std::string &address)
{
  auto now = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = next_slot_.find(address);
    slot = (it == next_slot_.end() || it->second < now) ? now : it->second;
    next_slot_[address] = slot + interval_;
  }

  auto wait = slot - now;
  if (wait > std::chrono::steady_clock::duration::zero())
  {
    LOG("Rate limiting " << address << " for "
                         << std::chrono::duration_cast<std::chrono::milliseconds>(wait).count() << "ms");
    sleeper_(wait);
  }
  return wait;
}

void RateLimiter::reset(const std::string &address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  next_slot_.erase(address);
}

void RateLimiter::reset_all()
{
  std::lock_guard<std::mutex> lock(mutex_);
  next_slot_.clear();
}

} // namespace bluos
