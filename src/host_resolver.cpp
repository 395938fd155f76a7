#include "bluos/host_resolver.h"

#include "log.h"
#include "resolve_worker.h"

#include <asio.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

namespace bluos
{

namespace
{

// Shared between the waiting caller and the worker, which may outlive it.
struct PendingResolve
{
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::vector<std::string> addresses;
  std::string error;
};

void run_lookup(std::shared_ptr<PendingResolve> pending, const std::string &host)
{
  asio::io_context io;
  asio::ip::tcp::resolver resolver(io);
  asio::error_code ec;
  asio::ip::tcp::resolver::results_type results = resolver.resolve(asio::ip::tcp::v4(), host, "", ec);

  std::vector<std::string> addresses;
  if (!ec)
  {
    for (const auto &entry : results)
    {
      asio::ip::address addr = entry.endpoint().address();
      if (addr.is_v4())
        addresses.push_back(addr.to_string());
    }
  }

  std::lock_guard<std::mutex> lock(pending->mutex);
  if (ec)
    pending->error = ec.message();
  else if (addresses.empty())
    pending->error = "no IPv4 address";
  pending->addresses = std::move(addresses);
  pending->done = true;
  pending->cv.notify_all();
}

} // namespace

ResolveOutcome resolve_ipv4(const std::string &host, std::chrono::milliseconds timeout)
{
  ResolveOutcome outcome;
  auto pending = std::make_shared<PendingResolve>();
  try
  {
    std::thread(run_lookup, pending, host).detach();
  }
  catch (const std::system_error &e)
  {
    outcome.error = std::string("cannot start resolver: ") + e.what();
    return outcome;
  }

  std::unique_lock<std::mutex> lock(pending->mutex);
  if (!pending->cv.wait_for(lock, timeout, [&pending] { return pending->done; }))
  {
    outcome.timed_out = true;
    return outcome;
  }
  outcome.addresses = pending->addresses;
  outcome.error = pending->error;
  return outcome;
}

std::optional<std::string> AsioHostResolver::resolve(const std::string &host, std::chrono::milliseconds timeout)
{
  ResolveOutcome outcome = resolve_ipv4(host, timeout);
  if (outcome.timed_out)
  {
    LOG("Resolving " << host << " timed out after " << timeout.count() << "ms");
    return std::nullopt;
  }
  if (outcome.addresses.empty())
  {
    LOG("Resolving " << host << " failed: " << outcome.error);
    return std::nullopt;
  }
  return outcome.addresses.front();
}

} // namespace bluos
