#include "bluos/request_executor.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"

#include <regex>
#include <thread>

namespace bluos
{

bool validate_endpoint(const std::string &endpoint)
{
  static const std::regex endpoint_regex("^/[A-Za-z0-9/_.\\-]*$");
  return endpoint.size() <= 256 && std::regex_match(endpoint, endpoint_regex);
}

RequestExecutor::RequestExecutor(HttpTransport &transport, RateLimiter &limiter, RetryPolicy policy,
                                 CircuitBreaker *breaker, Sleeper sleeper)
    : transport_(transport), limiter_(limiter), policy_(std::move(policy)), breaker_(breaker),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
      }))
{
}

Response RequestExecutor::execute(const Device &device, const std::string &endpoint, HttpMethod method,
                                  const QueryParams &params, std::chrono::milliseconds timeout,
                                  const CallOptions &options)
{
  const std::string &address = device.address;
  if (!validate_ip(address))
    throw ValidationError("invalid device address '" + address + "'", address);
  if (!validate_endpoint(endpoint))
    throw ValidationError("invalid endpoint '" + endpoint + "'", address);
  if (timeout.count() <= 0 || timeout > MAX_REQUEST_TIMEOUT)
    throw ValidationError("request timeout " + std::to_string(timeout.count()) + "ms is outside (0, 60s]", address);

  if (breaker_ && !breaker_->allow(address))
  {
    throw TransportError(ErrorKind::CircuitOpen, "circuit open for " + address, address);
  }

  HttpRequest request;
  request.method = method;
  request.host = address;
  request.port = options.port != 0 ? options.port : device.port;
  request.target = endpoint;
  if (!params.empty())
    request.target += "?" + build_query(params);
  request.body = options.body;
  request.timeout = timeout;

  RetryState state(policy_, options.idempotent);
  while (state.begin_attempt())
  {
    limiter_.wait_if_needed(address);
    try
    {
      HttpResponse response = transport_.send(request);
      raise_for_status(response, address);
      state.on_success();
      if (breaker_)
        breaker_->record_success(address);

      Response result;
      result.status = response.status;
      result.body = std::move(response.body);
      result.attempts = state.attempts();
      return result;
    }
    catch (Error &e)
    {
      e.attempts = state.attempts();
      std::optional<std::chrono::milliseconds> delay = state.on_failure(e.kind);
      if (!delay)
      {
        if (breaker_ && policy_.is_retryable(e.kind))
          breaker_->record_failure(address);
        LOG_WARN(request.target << " on " << address << " failed after " << state.attempts()
                                << (state.attempts() == 1 ? " attempt: " : " attempts: ") << e.what());
        throw;
      }
      LOG(request.target << " on " << address << " failed (" << error_kind_name(e.kind) << "), retry "
                         << state.attempts() << " in " << delay->count() << "ms");
      sleeper_(*delay);
    }
  }

  // Not reached: a first attempt is always granted.
  throw TransportError(ErrorKind::ConnectionFailed, "no attempt made for " + address, address);
}

} // namespace bluos
