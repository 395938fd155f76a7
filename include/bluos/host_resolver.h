#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace bluos
{

class HostResolver
{
public:
  virtual ~HostResolver() = default;

  // First IPv4 address of the host, or nothing when it does not resolve in
  // time.
  virtual std::optional<std::string> resolve(const std::string &host, std::chrono::milliseconds timeout) = 0;
};

class AsioHostResolver : public HostResolver
{
public:
  std::optional<std::string> resolve(const std::string &host, std::chrono::milliseconds timeout) override;
};

} // namespace bluos
