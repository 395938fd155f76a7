#include "bluos/retry_policy.h"

#include "log.h"

#include <algorithm>

namespace bluos
{

std::chrono::milliseconds RetryPolicy::delay_before(int retry) const
{
  if (retry < 1)
    return std::chrono::milliseconds(0);

  // Doubling stops once the ceiling is reached, so large retry numbers
  // never overflow.
  std::chrono::milliseconds delay = base_delay;
  for (int i = 1; i < retry && delay < max_delay; i++)
    delay *= 2;
  return std::min(delay, max_delay);
}

RetryState::RetryState(const RetryPolicy &policy, bool idempotent)
    : policy_(policy), idempotent_(idempotent), phase_(Phase::Ready), attempts_(0) {}

bool RetryState::begin_attempt()
{
  if (phase_ != Phase::Ready && phase_ != Phase::Waiting)
    return false;
  if (attempts_ >= std::max(1, policy_.max_attempts))
  {
    phase_ = Phase::Failed;
    return false;
  }
  attempts_++;
  phase_ = Phase::Attempting;
  return true;
}

void RetryState::on_success()
{
  phase_ = Phase::Succeeded;
}

std::optional<std::chrono::milliseconds> RetryState::on_failure(ErrorKind kind)
{
  if (!idempotent_ || !policy_.is_retryable(kind) || attempts_ >= policy_.max_attempts)
  {
    phase_ = Phase::Failed;
    return std::nullopt;
  }
  phase_ = Phase::Waiting;
  return policy_.delay_before(attempts_);
}

CircuitBreaker::CircuitBreaker(int threshold, std::chrono::milliseconds cooldown, Clock clock)
    : threshold_(std::max(0, threshold)), cooldown_(cooldown),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
{
}

bool CircuitBreaker::allow(const std::string &address)
{
  if (!enabled())
    return true;

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(address);
  if (it == entries_.end() || !it->second.open_until)
    return true;

  if (clock_() < *it->second.open_until)
    return false;

  // Half open: let one trial through and re-arm the window in case it
  // fails as well.
  it->second.open_until = clock_() + cooldown_;
  LOG("Circuit for " << address << " half open, allowing a trial call");
  return true;
}

void CircuitBreaker::record_success(const std::string &address)
{
  if (!enabled())
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(address);
}

void CircuitBreaker::record_failure(const std::string &address)
{
  if (!enabled())
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  Entry &entry = entries_[address];
  entry.failures++;
  if (entry.failures >= threshold_)
  {
    entry.open_until = clock_() + cooldown_;
    LOG_WARN("Circuit for " << address << " opened after " << entry.failures << " consecutive failures");
  }
}

bool CircuitBreaker::is_open(const std::string &address) const
{
  if (!enabled())
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(address);
  return it != entries_.end() && it->second.open_until && clock_() < *it->second.open_until;
}

} // namespace bluos
