#pragma once

#include "bluos/device.h"
#include "bluos/retry_policy.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace bluos
{

static const int DEFAULT_SAFE_VOLUME = 14;

struct UnifiSettings
{
  bool enabled = false;
  std::string controller; // host name or address, optionally with :port
  std::string site = "default";
  std::string api_key;    // fallback when the secret store has none
  std::string cache_path; // client map cache, empty to disable
  std::chrono::seconds cache_ttl{300};
};

// Every tunable, resolved. Components take the values they need; nothing
// reads configuration on its own.
struct Settings
{
  std::string service_type = "_musc._tcp";
  DiscoveryMethod discovery_method = DiscoveryMethod::Mdns;
  std::chrono::seconds discovery_timeout{5};
  std::chrono::seconds cache_ttl{300};
  int safe_volume = DEFAULT_SAFE_VOLUME;
  std::chrono::milliseconds rate_limit_interval{100};
  RetryPolicy retry;
  std::chrono::milliseconds status_timeout{3000};
  std::chrono::milliseconds command_timeout{2000};
  size_t discovery_workers = 10;
  size_t command_workers = 20;
  int breaker_threshold = 0;
  std::chrono::seconds breaker_cooldown{30};
  std::string cache_path;
  UnifiSettings unifi;
};

// $XDG_CONFIG_HOME/bluos-control, else ~/.config/bluos-control.
std::string default_config_dir();
std::string default_config_path();
std::string default_cache_path();
std::string default_unifi_cache_path();

Settings default_settings();

// Reads a JSON object of settings. Keys are case-insensitive; values may be
// strings or JSON scalars. Invalid values are logged and replaced by their
// defaults, out of range numbers are clamped. Malformed text yields the
// defaults. Never throws.
Settings parse_settings(const std::string &json_text);

// Loads path, creating it with the defaults (mode 0600) when missing.
Settings load_settings(const std::string &path);

std::string settings_to_json(const Settings &settings);

} // namespace bluos
