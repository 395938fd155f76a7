#pragma once

#include "bluos/device.h"
#include "bluos/discovery_orchestrator.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace bluos
{

static const std::chrono::seconds MAX_CACHE_TTL(3600);

using WallClock = std::function<std::chrono::system_clock::time_point()>;

// Last discovery result in one JSON file, valid for a TTL. A TTL of zero
// disables the cache entirely. Writes are atomic (temp file and rename);
// concurrent writers are last-writer-wins.
class DeviceCache
{
public:
  DeviceCache(std::string path, std::chrono::seconds ttl, WallClock clock = WallClock());

  // Unexpired entry only. Unreadable or corrupt files are a miss.
  std::optional<DiscoveryResult> get() const;

  // Last entry regardless of age; stale is set once it has expired.
  std::optional<DiscoveryResult> get_stale() const;

  // Throws CacheError when the file cannot be written.
  void put(const DiscoveryResult &result) const;

  void clear() const;

  bool enabled() const { return ttl_.count() > 0; }
  std::chrono::seconds ttl() const { return ttl_; }
  const std::string &path() const { return path_; }
  std::chrono::system_clock::time_point now() const { return clock_(); }

private:
  // Throws CacheError on unreadable or malformed content.
  std::optional<DiscoveryResult> load() const;
  bool expired(const DiscoveryResult &result) const;

  std::string path_;
  std::chrono::seconds ttl_;
  WallClock clock_;
};

// Cache in front of the orchestrator. Falls back to the last known entry,
// flagged stale, when a fresh pass finds nothing.
class CachedDiscovery
{
public:
  CachedDiscovery(DiscoveryOrchestrator &orchestrator, const DeviceCache &cache,
                  DiscoveryMethod method, std::chrono::milliseconds timeout);

  DiscoveryResult lookup(bool force_refresh = false);

private:
  DiscoveryOrchestrator &orchestrator_;
  const DeviceCache &cache_;
  DiscoveryMethod method_;
  std::chrono::milliseconds timeout_;
};

} // namespace bluos
