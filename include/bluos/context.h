#pragma once

#include "bluos/device_cache.h"
#include "bluos/diagnostics.h"
#include "bluos/discovery_orchestrator.h"
#include "bluos/dispatcher.h"
#include "bluos/host_resolver.h"
#include "bluos/http_transport.h"
#include "bluos/lsdp_discovery.h"
#include "bluos/mdns_discovery.h"
#include "bluos/network_stats.h"
#include "bluos/player_controller.h"
#include "bluos/process_runner.h"
#include "bluos/rate_limiter.h"
#include "bluos/request_executor.h"
#include "bluos/retry_policy.h"
#include "bluos/secret_store.h"
#include "bluos/settings.h"

namespace bluos
{

// Owns every long-lived component for one process, wired from a resolved
// Settings value. Members are declared in dependency order.
class Context
{
public:
  explicit Context(Settings settings);

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  const Settings &settings() const { return settings_; }

  CachedDiscovery &discovery() { return cached_discovery_; }
  DeviceCache &cache() { return cache_; }
  PlayerController &players() { return players_; }
  UnifiStatsProvider &network_stats() { return network_stats_; }
  Diagnostics &diagnostics() { return diagnostics_; }
  KeychainSecretStore &keychain() { return keychain_; }
  const Dispatcher &dispatcher() const { return dispatcher_; }

private:
  Settings settings_;

  PosixProcessRunner runner_;
  AsioHostResolver resolver_;
  MdnsDiscovery mdns_;
  LsdpDiscovery lsdp_;
  DiscoveryOrchestrator orchestrator_;
  DeviceCache cache_;
  CachedDiscovery cached_discovery_;

  RateLimiter limiter_;
  CircuitBreaker breaker_;
  AsioHttpTransport device_transport_;
  AsioHttpTransport controller_transport_;
  RequestExecutor executor_;
  Dispatcher dispatcher_;
  PlayerController players_;

  ChainedSecretStore secrets_;
  KeychainSecretStore keychain_;
  UnifiStatsProvider network_stats_;
  Diagnostics diagnostics_;
};

} // namespace bluos
