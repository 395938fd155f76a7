#include "bluos/status_json.h"

#include "bluos/errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bluos
{

namespace
{

json client_to_json(const NetworkClient &c)
{
  return json{{"wired", c.wired},
              {"uplink", c.uplink},
              {"port", c.port_info},
              {"mac", c.mac},
              {"down_total", c.down_total},
              {"up_total", c.up_total},
              {"down_rate", c.down_rate},
              {"up_rate", c.up_rate},
              {"uptime", c.uptime}};
}

json status_fields(const PlayerStatus &s)
{
  json entry{{"model", s.sync.full_model()},
             {"firmware", s.sync.firmware},
             {"state", play_state_name(s.playback.state)},
             {"volume", s.playback.volume},
             {"muted", s.playback.muted},
             {"service", s.playback.service},
             {"title", s.playback.title},
             {"artist", s.playback.artist},
             {"album", s.playback.album},
             {"role", sync_role_name(s.sync.role)},
             {"master", s.sync.master},
             {"slaves", s.sync.slaves}};
  entry["battery"] = s.sync.battery ? json(*s.sync.battery) : json(nullptr);
  return entry;
}

} // namespace

std::string status_to_json(const std::map<std::string, Outcome<PlayerStatus>> &outcomes,
                           const std::map<std::string, NetworkClient> &clients)
{
  json devices = json::array();
  for (const auto &pair : outcomes)
  {
    const Outcome<PlayerStatus> &outcome = pair.second;
    json entry{{"address", outcome.device.address}, {"ok", outcome.ok}, {"attempts", outcome.attempts}};
    if (outcome.ok && outcome.value)
    {
      entry["name"] = outcome.value->sync.name;
      entry.update(status_fields(*outcome.value));
    }
    else
    {
      entry["name"] = outcome.device.display_name();
      entry["error"] = json{{"kind", error_kind_name(outcome.error.kind)}, {"message", outcome.error.message}};
    }

    auto client = clients.find(outcome.device.address);
    if (client != clients.end())
      entry["network"] = client_to_json(client->second);
    devices.push_back(entry);
  }
  // Device supplied text is not guaranteed to be UTF-8.
  return devices.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace bluos
