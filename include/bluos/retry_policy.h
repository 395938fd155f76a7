#pragma once

#include "bluos/errors.h"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace bluos
{

struct RetryPolicy
{
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{10000};
  std::set<ErrorKind> retryable = {ErrorKind::Timeout, ErrorKind::ConnectionFailed,
                                   ErrorKind::ConnectionReset, ErrorKind::ServerError};

  bool is_retryable(ErrorKind kind) const { return retryable.count(kind) > 0; }

  // Delay before retry n (n >= 1): min(base * 2^(n-1), max).
  std::chrono::milliseconds delay_before(int retry) const;
};

// Attempt bookkeeping for one execution.
class RetryState
{
public:
  enum class Phase
  {
    Ready,
    Attempting,
    Waiting,
    Succeeded,
    Failed
  };

  explicit RetryState(const RetryPolicy &policy, bool idempotent = true);

  // Moves Ready or Waiting to Attempting. False once no attempt remains.
  bool begin_attempt();

  void on_success();

  // Records a failed attempt. Returns the delay to wait before the next
  // attempt, or nothing when the execution has failed for good.
  std::optional<std::chrono::milliseconds> on_failure(ErrorKind kind);

  Phase phase() const { return phase_; }
  int attempts() const { return attempts_; }

private:
  const RetryPolicy &policy_;
  bool idempotent_;
  Phase phase_;
  int attempts_;
};

// Per-device breaker. After `threshold` consecutive failed executions the
// device is refused for `cooldown`, then one trial call is let through. A
// threshold of zero disables it.
class CircuitBreaker
{
public:
  typedef std::function<std::chrono::steady_clock::time_point()> Clock;

  explicit CircuitBreaker(int threshold = 0, std::chrono::milliseconds cooldown = std::chrono::seconds(30),
                          Clock clock = Clock());

  bool enabled() const { return threshold_ > 0; }
  bool allow(const std::string &address);
  void record_success(const std::string &address);
  void record_failure(const std::string &address);
  bool is_open(const std::string &address) const;

private:
  struct Entry
  {
    int failures = 0;
    std::optional<std::chrono::steady_clock::time_point> open_until;
  };

  int threshold_;
  std::chrono::milliseconds cooldown_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace bluos
