#include "bluos/network_stats.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "file_util.h"
#include "log.h"
#include "string_util.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <set>
#include <utility>

using json = nlohmann::json;

namespace bluos
{

const char *network_stats_status_name(NetworkStatsStatus status)
{
  switch (status)
  {
  case NetworkStatsStatus::Skipped:
    return "SKIPPED";
  case NetworkStatsStatus::MissingConfig:
    return "MISSING_CONFIG";
  case NetworkStatsStatus::FetchError:
    return "ERROR_FETCH";
  case NetworkStatsStatus::ParseError:
    return "ERROR_PARSE";
  case NetworkStatsStatus::Success:
    return "SUCCESS";
  case NetworkStatsStatus::Cached:
    return "CACHED";
  }
  return "UNKNOWN";
}

std::string NetworkStats::summary() const
{
  if (status == NetworkStatsStatus::Success)
    return "SUCCESS:" + std::to_string(clients.size());
  return network_stats_status_name(status);
}

namespace
{

std::string text_field(const json &client, const char *key)
{
  auto it = client.find(key);
  if (it == client.end() || it->is_null())
    return "";
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_number_integer())
    return std::to_string(it->get<long long>());
  return "";
}

uint64_t counter_field(const json &client, const std::string &key)
{
  auto it = client.find(key);
  if (it == client.end() || !it->is_number() || it->get<double>() < 0)
    return 0;
  return static_cast<uint64_t>(it->get<double>());
}

bool is_wired_client(const json &client)
{
  auto it = client.find("is_wired");
  if (it != client.end() && it->is_boolean() && it->get<bool>())
    return true;
  return to_upper(text_field(client, "type")) == "WIRED";
}

} // namespace

std::map<std::string, NetworkClient> parse_unifi_clients(const std::string &json_text,
                                                         const std::vector<std::string> &addresses)
{
  json doc;
  try
  {
    doc = json::parse(json_text);
  }
  catch (const json::exception &e)
  {
    throw ProtocolError(std::string("malformed controller response: ") + e.what());
  }

  if (!doc.is_object())
    throw ProtocolError("controller response is not a JSON object");
  auto data = doc.find("data");
  if (data == doc.end())
    return {};
  if (!data->is_array())
    throw ProtocolError("controller response data is not a list");

  std::set<std::string> wanted(addresses.begin(), addresses.end());
  std::map<std::string, NetworkClient> clients;

  for (const auto &entry : *data)
  {
    if (!entry.is_object())
      continue;
    std::optional<std::string> ip = sanitize_ip(text_field(entry, "ip"));
    if (!ip || !wanted.count(*ip))
      continue;

    NetworkClient c;
    c.mac = to_lower(text_field(entry, "mac"));
    c.wired = is_wired_client(entry);

    std::string prefix;
    if (c.wired)
    {
      prefix = "wired-";
      c.uplink = text_field(entry, "last_uplink_name");
      if (c.uplink.empty())
        c.uplink = "Unknown Switch";
      c.port_info = text_field(entry, "sw_port");
      if (c.port_info.empty())
        c.port_info = text_field(entry, "last_uplink_remote_port");
    }
    else
    {
      for (const char *key : {"ap_name", "last_uplink_name", "ap_mac"})
      {
        c.uplink = text_field(entry, key);
        if (!c.uplink.empty())
          break;
      }
      if (c.uplink.empty())
        c.uplink = "Unknown AP";
      std::string essid = text_field(entry, "essid");
      c.port_info = essid.empty() ? "WiFi" : "WiFi: " + essid;
    }

    // tx is the controller's view, so it is the device's download.
    c.down_total = counter_field(entry, prefix + "tx_bytes");
    c.up_total = counter_field(entry, prefix + "rx_bytes");
    c.down_rate = counter_field(entry, prefix + "tx_bytes-r");
    c.up_rate = counter_field(entry, prefix + "rx_bytes-r");
    c.uptime = counter_field(entry, "uptime");
    clients[*ip] = c;
  }
  return clients;
}

std::string unifi_clients_to_json(const std::map<std::string, NetworkClient> &clients, double timestamp)
{
  json entries = json::object();
  for (const auto &pair : clients)
  {
    const NetworkClient &c = pair.second;
    entries[pair.first] = json{{"mac", c.mac},
                               {"wired", c.wired},
                               {"uplink", c.uplink},
                               {"port_info", c.port_info},
                               {"down_total", c.down_total},
                               {"up_total", c.up_total},
                               {"down_rate", c.down_rate},
                               {"up_rate", c.up_rate},
                               {"uptime", c.uptime}};
  }
  return json{{"ts", timestamp}, {"clients", entries}}.dump();
}

UnifiStatsProvider::UnifiStatsProvider(HttpTransport &transport, SecretStore &secrets, UnifiSettings settings,
                                       WallClock clock)
    : transport_(transport), secrets_(secrets), settings_(std::move(settings)), clock_(std::move(clock))
{
  if (!clock_)
    clock_ = [] { return std::chrono::system_clock::now(); };
}

double UnifiStatsProvider::now_seconds() const
{
  return std::chrono::duration<double>(clock_().time_since_epoch()).count();
}

bool UnifiStatsProvider::load_cached(const std::vector<std::string> &addresses, NetworkStats &stats) const
{
  if (settings_.cache_path.empty() || settings_.cache_ttl.count() <= 0)
    return false;
  std::ifstream in(settings_.cache_path);
  if (!in)
    return false;

  std::set<std::string> wanted(addresses.begin(), addresses.end());
  std::map<std::string, NetworkClient> clients;
  try
  {
    json doc = json::parse(in);
    double ts = doc.at("ts").get<double>();
    double age = now_seconds() - ts;
    if (!std::isfinite(ts) || age < 0 || age >= static_cast<double>(settings_.cache_ttl.count()))
      return false;

    for (const auto &entry : doc.at("clients").items())
    {
      if (!wanted.count(entry.key()))
        continue;
      const json &v = entry.value();
      NetworkClient c;
      c.mac = v.at("mac").get<std::string>();
      c.wired = v.at("wired").get<bool>();
      c.uplink = v.at("uplink").get<std::string>();
      c.port_info = v.at("port_info").get<std::string>();
      c.down_total = v.at("down_total").get<uint64_t>();
      c.up_total = v.at("up_total").get<uint64_t>();
      c.down_rate = v.at("down_rate").get<uint64_t>();
      c.up_rate = v.at("up_rate").get<uint64_t>();
      c.uptime = v.at("uptime").get<uint64_t>();
      clients[entry.key()] = c;
    }
  }
  catch (const json::exception &e)
  {
    LOG("Ignoring UniFi cache " << settings_.cache_path << ": " << e.what());
    return false;
  }

  stats.status = NetworkStatsStatus::Cached;
  stats.clients = std::move(clients);
  return true;
}

void UnifiStatsProvider::store_cached(const std::map<std::string, NetworkClient> &clients) const
{
  if (settings_.cache_path.empty() || settings_.cache_ttl.count() <= 0)
    return;
  std::string error;
  if (!write_private_file(settings_.cache_path, unifi_clients_to_json(clients, now_seconds()), error))
    LOG_WARN("Failed to write UniFi cache: " << error);
}

NetworkStats UnifiStatsProvider::fetch(const std::vector<std::string> &addresses)
{
  NetworkStats stats;
  if (!settings_.enabled || addresses.empty())
    return stats;

  std::string key = secrets_.resolve(UNIFI_API_KEY_SECRET);
  if (key.empty())
    key = settings_.api_key;
  if (settings_.controller.empty() || key.empty())
  {
    stats.status = NetworkStatsStatus::MissingConfig;
    return stats;
  }

  if (load_cached(addresses, stats))
  {
    LOG("UniFi clients from cache: " << stats.clients.size());
    return stats;
  }

  HttpRequest request;
  request.https = true;
  request.port = 443;
  request.host = settings_.controller;
  size_t colon = settings_.controller.find(':');
  if (colon != std::string::npos)
  {
    long port = 0;
    request.host = settings_.controller.substr(0, colon);
    if (!parse_long(settings_.controller.substr(colon + 1), port) || port < 1 || port > 65535)
    {
      stats.status = NetworkStatsStatus::MissingConfig;
      return stats;
    }
    request.port = static_cast<uint16_t>(port);
  }
  request.target = "/proxy/network/api/s/" + percent_encode(settings_.site) + "/stat/sta";
  request.headers["X-API-KEY"] = key;
  request.headers["Accept"] = "application/json";
  request.timeout = UNIFI_TIMEOUT;

  HttpResponse response;
  try
  {
    response = transport_.send(request);
    raise_for_status(response, request.host);
  }
  catch (const Error &e)
  {
    LOG_WARN("UniFi fetch failed, continuing without network stats: " << e.what());
    stats.status = NetworkStatsStatus::FetchError;
    return stats;
  }

  try
  {
    stats.clients = parse_unifi_clients(response.body, addresses);
  }
  catch (const ProtocolError &e)
  {
    LOG_ERROR("UniFi parse error: " << e.what());
    stats.status = NetworkStatsStatus::ParseError;
    return stats;
  }

  stats.status = NetworkStatsStatus::Success;
  store_cached(stats.clients);
  LOG("UniFi matched " << stats.clients.size() << " of " << addresses.size() << " devices");
  return stats;
}

} // namespace bluos
