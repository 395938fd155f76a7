#include "bluos/device_cache.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "file_util.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>

#include <unistd.h>

using json = nlohmann::json;

namespace bluos
{

namespace
{

// Year 5138; anything later is not a real capture time.
static const double MAX_CACHE_TIMESTAMP = 1e11;

double to_epoch_seconds(std::chrono::system_clock::time_point tp)
{
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(double seconds)
{
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(seconds)));
}

json device_to_json(const Device &d)
{
  return json{{"address", d.address},
              {"name", d.name},
              {"model", d.model},
              {"brand", d.brand},
              {"class", device_class_name(d.device_class)},
              {"mac", d.mac},
              {"port", d.port}};
}

Device device_from_json(const json &j)
{
  Device d;
  d.address = j.at("address").get<std::string>();
  d.name = j.value("name", "");
  d.model = j.value("model", "");
  d.brand = j.value("brand", "");
  d.device_class = device_class_from_name(j.value("class", "unknown"));
  d.mac = j.value("mac", "");
  int port = j.value("port", static_cast<int>(DEVICE_PORT));
  d.port = port > 0 && port <= 0xFFFF ? static_cast<uint16_t>(port) : DEVICE_PORT;
  return d;
}

} // namespace

DeviceCache::DeviceCache(std::string path, std::chrono::seconds ttl, WallClock clock)
    : path_(std::move(path)),
      ttl_(std::max(std::chrono::seconds(0), std::min(ttl, MAX_CACHE_TTL))),
      clock_(clock ? std::move(clock) : WallClock([] { return std::chrono::system_clock::now(); }))
{
  if (ttl != ttl_)
  {
    LOG_WARN("Cache TTL " << ttl.count() << "s clamped to " << ttl_.count() << "s");
  }
}

std::optional<DiscoveryResult> DeviceCache::load() const
{
  std::ifstream in(path_);
  if (!in)
    return std::nullopt;

  json doc;
  try
  {
    doc = json::parse(in);
  }
  catch (const json::exception &e)
  {
    throw CacheError(std::string("malformed cache: ") + e.what(), path_);
  }

  if (!doc.is_object() || !doc.contains("devices") || !doc["devices"].is_array() ||
      !doc.contains("timestamp") || !doc["timestamp"].is_number())
  {
    throw CacheError("cache is missing devices or timestamp", path_);
  }

  double timestamp = doc["timestamp"].get<double>();
  if (!std::isfinite(timestamp) || timestamp < 0 || timestamp >= MAX_CACHE_TIMESTAMP)
  {
    throw CacheError("cache timestamp out of range", path_);
  }

  DiscoveryResult result;
  result.captured_at = from_epoch_seconds(timestamp);
  result.source = source_tag_from_name(doc.value("source", "none"));

  for (const auto &entry : doc["devices"])
  {
    try
    {
      Device device = device_from_json(entry);
      if (!validate_ip(device.address))
      {
        LOG("Ignoring cached device with invalid address " << device.address);
        continue;
      }
      result.devices.push_back(device);
    }
    catch (const json::exception &e)
    {
      LOG("Ignoring malformed cached device: " << e.what());
    }
  }

  if (result.devices.empty())
    return std::nullopt;

  result.devices = normalize_devices(std::move(result.devices));
  return result;
}

bool DeviceCache::expired(const DiscoveryResult &result) const
{
  auto now = clock_();
  return now < result.captured_at || now >= result.captured_at + ttl_;
}

std::optional<DiscoveryResult> DeviceCache::get() const
{
  if (!enabled())
    return std::nullopt;

  std::optional<DiscoveryResult> result;
  try
  {
    result = load();
  }
  catch (const CacheError &e)
  {
    LOG_WARN("Discarding device cache " << e.path << ": " << e.what());
    return std::nullopt;
  }

  if (!result || expired(*result))
    return std::nullopt;
  return result;
}

std::optional<DiscoveryResult> DeviceCache::get_stale() const
{
  if (!enabled())
    return std::nullopt;

  std::optional<DiscoveryResult> result;
  try
  {
    result = load();
  }
  catch (const CacheError &e)
  {
    LOG_WARN("Discarding device cache " << e.path << ": " << e.what());
    return std::nullopt;
  }

  if (result)
    result->stale = expired(*result);
  return result;
}

void DeviceCache::put(const DiscoveryResult &result) const
{
  if (!enabled())
    return;

  json devices = json::array();
  for (const auto &d : result.devices)
    devices.push_back(device_to_json(d));

  json doc{{"devices", devices},
           {"timestamp", to_epoch_seconds(result.captured_at)},
           {"source", source_tag_name(result.source)}};
  std::string payload = doc.dump(2);

  std::string error;
  if (!write_private_file(path_, payload, error))
    throw CacheError(error, path_);

  LOG("Cached " << result.devices.size() << " devices in " << path_);
}

void DeviceCache::clear() const
{
  if (unlink(path_.c_str()) != 0 && errno != ENOENT)
  {
    LOG_WARN("Could not remove cache " << path_ << ": " << std::strerror(errno));
  }
}

CachedDiscovery::CachedDiscovery(DiscoveryOrchestrator &orchestrator, const DeviceCache &cache,
                                 DiscoveryMethod method, std::chrono::milliseconds timeout)
    : orchestrator_(orchestrator), cache_(cache), method_(method), timeout_(timeout) {}

DiscoveryResult CachedDiscovery::lookup(bool force_refresh)
{
  if (!force_refresh)
  {
    std::optional<DiscoveryResult> hit = cache_.get();
    if (hit)
    {
      LOG("Using " << hit->devices.size() << " cached devices");
      return *hit;
    }
  }

  DiscoveryResult fresh = orchestrator_.discover(method_, timeout_);
  if (!fresh.empty())
  {
    fresh.captured_at = cache_.now();
    try
    {
      cache_.put(fresh);
    }
    catch (const CacheError &e)
    {
      LOG_WARN("Could not write device cache " << e.path << ": " << e.what());
    }
    return fresh;
  }

  std::optional<DiscoveryResult> last = cache_.get_stale();
  if (last)
  {
    last->stale = true;
    LOG_WARN("Discovery found no devices, using last known list of " << last->devices.size());
    return *last;
  }
  return fresh;
}

} // namespace bluos
