#pragma once

#include "bluos/device.h"
#include "bluos/http_transport.h"
#include "bluos/rate_limiter.h"
#include "bluos/retry_policy.h"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace bluos
{

static const std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT(5000);
static const std::chrono::milliseconds MAX_REQUEST_TIMEOUT(60000);

typedef std::vector<std::pair<std::string, std::string>> QueryParams;

struct Response
{
  int status = 0;
  std::string body;
  int attempts = 0;

  int retries() const { return attempts > 0 ? attempts - 1 : 0; }
};

struct CallOptions
{
  bool idempotent = true; // false: never retried
  uint16_t port = 0;      // 0: the device's REST port
  std::string body;       // form encoded, POST only
};

// One call to one device: validation, rate limiting, retries with backoff
// and the optional circuit breaker. Shared by all workers.
class RequestExecutor
{
public:
  typedef std::function<void(std::chrono::milliseconds)> Sleeper;

  RequestExecutor(HttpTransport &transport, RateLimiter &limiter, RetryPolicy policy = RetryPolicy(),
                  CircuitBreaker *breaker = nullptr, Sleeper sleeper = Sleeper());

  // Throws ValidationError before any I/O, TransportError, ProtocolError
  // or DeviceError once attempts are exhausted.
  Response execute(const Device &device, const std::string &endpoint, HttpMethod method = HttpMethod::Get,
                   const QueryParams &params = QueryParams(),
                   std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT,
                   const CallOptions &options = CallOptions());

  const RetryPolicy &policy() const { return policy_; }

private:
  HttpTransport &transport_;
  RateLimiter &limiter_;
  RetryPolicy policy_;
  CircuitBreaker *breaker_;
  Sleeper sleeper_;
};

bool validate_endpoint(const std::string &endpoint);

} // namespace bluos
