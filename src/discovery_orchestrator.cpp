#include "bluos/discovery_orchestrator.h"

#include "bluos/errors.h"
#include "log.h"

namespace bluos
{

DiscoveryOrchestrator::DiscoveryOrchestrator(DiscoverySource &mdns, DiscoverySource &lsdp)
    : mdns_(mdns), lsdp_(lsdp) {}

DiscoveryResult DiscoveryOrchestrator::run_source(DiscoverySource &source, std::chrono::milliseconds timeout)
{
  DiscoveryResult result;
  result.source = source.tag();
  try
  {
    result.devices = normalize_devices(source.discover(timeout));
  }
  catch (const std::exception &e)
  {
    LOG_WARN(source_tag_name(source.tag()) << " discovery failed: " << e.what());
    result.devices.clear();
  }
  result.captured_at = std::chrono::system_clock::now();
  LOG(source_tag_name(result.source) << " discovery found " << result.devices.size() << " devices");
  return result;
}

DiscoveryResult DiscoveryOrchestrator::discover(DiscoveryMethod method, std::chrono::milliseconds timeout)
{
  if (timeout < MIN_DISCOVERY_TIMEOUT || timeout > MAX_DISCOVERY_TIMEOUT)
  {
    throw ValidationError("discovery timeout " + std::to_string(timeout.count()) + "ms is outside 1..60s");
  }

  switch (method)
  {
  case DiscoveryMethod::Mdns:
    return run_source(mdns_, timeout);
  case DiscoveryMethod::Lsdp:
    return run_source(lsdp_, timeout);
  case DiscoveryMethod::Both:
    break;
  }

  DiscoveryResult result = run_source(mdns_, timeout);
  if (!result.empty())
    return result;

  LOG("mDNS found no devices, falling back to LSDP");
  return run_source(lsdp_, timeout);
}

} // namespace bluos
