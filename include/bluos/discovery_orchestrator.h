#pragma once

#include "bluos/device.h"
#include "bluos/discovery_source.h"

#include <chrono>

namespace bluos
{

static const std::chrono::seconds MIN_DISCOVERY_TIMEOUT(1);
static const std::chrono::seconds MAX_DISCOVERY_TIMEOUT(60);

// Runs one or both discovery sources and reconciles their records. With
// DiscoveryMethod::Both, LSDP runs only when mDNS found nothing, and the two
// sources are never merged.
class DiscoveryOrchestrator
{
public:
  DiscoveryOrchestrator(DiscoverySource &mdns, DiscoverySource &lsdp);

  // Throws ValidationError when the timeout is outside 1..60 seconds. An
  // empty network is an empty result.
  DiscoveryResult discover(DiscoveryMethod method, std::chrono::milliseconds timeout);

private:
  DiscoveryResult run_source(DiscoverySource &source, std::chrono::milliseconds timeout);

  DiscoverySource &mdns_;
  DiscoverySource &lsdp_;
};

} // namespace bluos
