#pragma once

#include "bluos/device.h"

#include <chrono>
#include <vector>

namespace bluos
{

// One discovery protocol. Implementations absorb their own collaborator
// failures and report them as an empty result.
class DiscoverySource
{
public:
  virtual ~DiscoverySource() = default;

  virtual std::vector<Device> discover(std::chrono::milliseconds timeout) = 0;
  virtual DiscoverySourceTag tag() const = 0;
};

} // namespace bluos
