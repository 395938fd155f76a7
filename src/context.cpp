#include "bluos/context.h"

#include <memory>
#include <utility>

namespace bluos
{

namespace
{

ChainedSecretStore &default_secret_chain(ChainedSecretStore &chain, ProcessRunner &runner)
{
  chain.add(std::make_unique<EnvironmentSecretStore>());
  chain.add(std::make_unique<KeychainSecretStore>(runner));
  return chain;
}

} // namespace

Context::Context(Settings settings)
    : settings_(std::move(settings)),
      mdns_(runner_, resolver_, settings_.service_type),
      orchestrator_(mdns_, lsdp_),
      cache_(settings_.cache_path, settings_.cache_ttl),
      cached_discovery_(orchestrator_, cache_, settings_.discovery_method, settings_.discovery_timeout),
      limiter_(settings_.rate_limit_interval),
      breaker_(settings_.breaker_threshold, settings_.breaker_cooldown),
      device_transport_(TlsPolicy::TrustLocalPeer),
      controller_transport_(TlsPolicy::VerifyPeer),
      executor_(device_transport_, limiter_, settings_.retry, breaker_.enabled() ? &breaker_ : nullptr),
      dispatcher_(settings_.discovery_workers, settings_.command_workers),
      players_(executor_, dispatcher_, controller_options(settings_)),
      keychain_(runner_),
      network_stats_(controller_transport_, default_secret_chain(secrets_, runner_), settings_.unifi),
      diagnostics_(players_, runner_, network_stats_)
{
}

} // namespace bluos
