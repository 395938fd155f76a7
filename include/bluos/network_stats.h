#pragma once

#include "bluos/device_cache.h"
#include "bluos/http_transport.h"
#include "bluos/secret_store.h"
#include "bluos/settings.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bluos
{

static const std::chrono::milliseconds UNIFI_TIMEOUT(4000);

struct NetworkClient
{
  std::string mac;
  bool wired = false;
  std::string uplink;    // switch or access point name
  std::string port_info; // switch port, or "WiFi: <essid>"
  uint64_t down_total = 0;
  uint64_t up_total = 0;
  uint64_t down_rate = 0;
  uint64_t up_rate = 0;
  uint64_t uptime = 0;
};

enum class NetworkStatsStatus
{
  Skipped,
  MissingConfig,
  FetchError,
  ParseError,
  Success,
  Cached
};

const char *network_stats_status_name(NetworkStatsStatus status);

struct NetworkStats
{
  NetworkStatsStatus status = NetworkStatsStatus::Skipped;
  std::map<std::string, NetworkClient> clients; // keyed by device address

  // "SUCCESS:<n>" or the bare status name.
  std::string summary() const;
};

// Maps the controller's client list onto the given addresses. Throws
// ProtocolError when the payload is not the expected JSON shape.
std::map<std::string, NetworkClient> parse_unifi_clients(const std::string &json_text,
                                                         const std::vector<std::string> &addresses);

std::string unifi_clients_to_json(const std::map<std::string, NetworkClient> &clients, double timestamp);

// Per-client link statistics from a UniFi Network controller. Failures are
// reported through the status and never thrown.
//
// A successful fetch is written to settings.cache_path; later fetches within
// settings.cache_ttl answer from that file with status Cached.
class UnifiStatsProvider
{
public:
  UnifiStatsProvider(HttpTransport &transport, SecretStore &secrets, UnifiSettings settings,
                     WallClock clock = WallClock());

  NetworkStats fetch(const std::vector<std::string> &addresses);

private:
  bool load_cached(const std::vector<std::string> &addresses, NetworkStats &stats) const;
  void store_cached(const std::map<std::string, NetworkClient> &clients) const;
  double now_seconds() const;

  HttpTransport &transport_;
  SecretStore &secrets_;
  UnifiSettings settings_;
  WallClock clock_;
};

} // namespace bluos
