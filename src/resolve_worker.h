#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace bluos
{

struct ResolveOutcome
{
  bool timed_out = false;
  std::vector<std::string> addresses; // IPv4, in resolver order
  std::string error;
};

// Looks the host up on a detached worker thread and waits at most timeout
// for it. The lookup itself cannot be interrupted, so a late answer is
// discarded by the worker.
ResolveOutcome resolve_ipv4(const std::string &host, std::chrono::milliseconds timeout);

} // namespace bluos
