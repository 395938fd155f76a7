#include "bluos/player_controller.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"
#include "string_util.h"

#include <algorithm>
#include <optional>
#include <utility>

namespace bluos
{

const char *player_command_name(PlayerCommand command)
{
  switch (command)
  {
  case PlayerCommand::Play:
    return "play";
  case PlayerCommand::Pause:
    return "pause";
  case PlayerCommand::Stop:
    return "stop";
  case PlayerCommand::Skip:
    return "skip";
  case PlayerCommand::Back:
    return "back";
  case PlayerCommand::Toggle:
    return "toggle";
  }
  return "unknown";
}

bool parse_player_command(const std::string &text, PlayerCommand &out)
{
  std::string s = to_lower(trim(text));
  if (s == "play")
    out = PlayerCommand::Play;
  else if (s == "pause")
    out = PlayerCommand::Pause;
  else if (s == "stop")
    out = PlayerCommand::Stop;
  else if (s == "skip" || s == "next")
    out = PlayerCommand::Skip;
  else if (s == "back" || s == "previous")
    out = PlayerCommand::Back;
  else if (s == "toggle")
    out = PlayerCommand::Toggle;
  else
    return false;
  return true;
}

ControllerOptions controller_options(const Settings &settings)
{
  ControllerOptions options;
  options.status_timeout = settings.status_timeout;
  options.command_timeout = settings.command_timeout;
  options.safe_volume = settings.safe_volume;
  return options;
}

namespace
{

template <typename T>
T require_decoded(std::optional<T> value, const char *endpoint, const std::string &address)
{
  if (!value)
    throw ProtocolError(std::string("unreadable ") + endpoint + " response", address);
  return std::move(*value);
}

} // namespace

GroupChange plan_group_change(const std::vector<Device> &devices, const std::string &master,
                              const std::vector<std::string> &slaves)
{
  GroupChange change;
  change.master = match_one_device(devices, master);
  if (slaves.empty())
    throw ValidationError("no players to group with " + change.master.display_name());

  for (const auto &slave : slaves)
  {
    std::optional<std::string> address = sanitize_ip(slave);
    if (!address)
      address = match_one_device(devices, slave).address;
    if (*address == change.master.address)
      throw ValidationError(change.master.display_name() + " cannot be its own slave", change.master.address);
    if (std::find(change.slaves.begin(), change.slaves.end(), *address) == change.slaves.end())
      change.slaves.push_back(*address);
  }
  return change;
}

PlayerController::PlayerController(RequestExecutor &executor, const Dispatcher &dispatcher,
                                   ControllerOptions options)
    : executor_(executor), dispatcher_(dispatcher), options_(options)
{
}

Response PlayerController::get(const Device &device, const std::string &endpoint, const QueryParams &params,
                                bool status_call)
{
  return executor_.execute(device, endpoint, HttpMethod::Get, params,
                           status_call ? options_.status_timeout : options_.command_timeout);
}

PlayerStatus PlayerController::status(const Device &device, int *attempts)
{
  Response sync = get(device, "/SyncStatus", QueryParams(), true);
  Response playback = get(device, "/Status", QueryParams(), true);
  if (attempts)
    *attempts = sync.attempts + playback.attempts;

  PlayerStatus status;
  status.device = device;
  try
  {
    status.sync = require_decoded(decode_sync_status(sync.body, device.address), "/SyncStatus", device.address);
    status.playback = require_decoded(decode_status(playback.body, device.address), "/Status", device.address);
  }
  catch (ProtocolError &e)
  {
    e.attempts = sync.attempts + playback.attempts;
    throw;
  }
  return status;
}

Response PlayerController::send(const Device &device, PlayerCommand command)
{
  switch (command)
  {
  case PlayerCommand::Play:
    return get(device, "/Play");
  case PlayerCommand::Pause:
    return get(device, "/Pause");
  case PlayerCommand::Stop:
    return get(device, "/Stop");
  case PlayerCommand::Skip:
    return get(device, "/Skip");
  case PlayerCommand::Back:
    return get(device, "/Back");
  case PlayerCommand::Toggle:
    return get(device, "/Pause", {{"toggle", "1"}});
  }
  throw ValidationError("unknown player command", device.address);
}

Response PlayerController::volume(const Device &device, const QueryParams &params)
{
  return get(device, "/Volume", params);
}

Response PlayerController::set_volume(const Device &device, int level)
{
  int checked = require_volume(level);
  return volume(device, {{"level", std::to_string(checked)}});
}

Response PlayerController::adjust_volume(const Device &device, int delta, int *new_level)
{
  Response current = get(device, "/Status", QueryParams(), true);
  StatusSnapshot snapshot = require_decoded(decode_status(current.body, device.address), "/Status", device.address);

  int level = clamp_volume(static_cast<long>(snapshot.volume) + delta);
  LOG(device.address << " volume " << snapshot.volume << " -> " << level);
  Response result = volume(device, {{"level", std::to_string(level)}});
  result.attempts += current.attempts;
  if (new_level)
    *new_level = level;
  return result;
}

Response PlayerController::set_muted(const Device &device, bool muted)
{
  return volume(device, {{"mute", muted ? "1" : "0"}});
}

Response PlayerController::reset_volume(const Device &device)
{
  return set_volume(device, options_.safe_volume);
}

std::vector<QueueItem> PlayerController::queue(const Device &device)
{
  Response response = get(device, "/Queue", QueryParams(), true);
  return require_decoded(decode_queue(response.body, device.address), "/Queue", device.address);
}

Response PlayerController::clear_queue(const Device &device)
{
  return get(device, "/Queue", {{"clear", "1"}});
}

Response PlayerController::move_queue_item(const Device &device, int from, int to)
{
  if (from < 0 || to < 0)
    throw ValidationError("queue positions must not be negative", device.address);
  return get(device, "/Queue", {{"move", std::to_string(from)}, {"to", std::to_string(to)}});
}

std::vector<InputInfo> PlayerController::inputs(const Device &device)
{
  Response response = get(device, "/AudioInputs", QueryParams(), true);
  return require_decoded(decode_inputs(response.body, device.address), "/AudioInputs", device.address);
}

Response PlayerController::select_input(const Device &device, const std::string &input)
{
  if (trim(input).empty() || !is_valid_utf8(input))
    throw ValidationError("invalid input name", device.address);
  return get(device, "/AudioInput", {{"input", input}});
}

BluetoothMode PlayerController::bluetooth_mode(const Device &device)
{
  Response response = get(device, "/AudioModes", QueryParams(), true);
  return require_decoded(decode_bluetooth_mode(response.body, device.address), "/AudioModes", device.address);
}

Response PlayerController::set_bluetooth_mode(const Device &device, BluetoothMode mode)
{
  int value = static_cast<int>(mode);
  if (value < 0 || value > 3)
    throw ValidationError("bluetooth mode must be 0..3", device.address);
  return get(device, "/audiomodes", {{"bluetoothAutoplay", std::to_string(value)}});
}

std::vector<PresetInfo> PlayerController::presets(const Device &device)
{
  Response response = get(device, "/Presets", QueryParams(), true);
  return require_decoded(decode_presets(response.body, device.address), "/Presets", device.address);
}

Response PlayerController::play_preset(const Device &device, int preset_id)
{
  if (preset_id < 1)
    throw ValidationError("preset id must be positive", device.address);
  return get(device, "/Preset", {{"id", std::to_string(preset_id)}});
}

Response PlayerController::add_slave(const Device &master, const std::string &slave_address)
{
  std::optional<std::string> slave = sanitize_ip(slave_address);
  if (!slave || *slave == master.address)
    throw ValidationError("invalid slave address '" + slave_address + "'", master.address);
  return get(master, "/Sync", {{"slave", *slave}});
}

Response PlayerController::remove_slave(const Device &master, const std::string &slave_address)
{
  std::optional<std::string> slave = sanitize_ip(slave_address);
  if (!slave)
    throw ValidationError("invalid slave address '" + slave_address + "'", master.address);
  return get(master, "/Sync", {{"remove", *slave}});
}

Response PlayerController::leave_group(const Device &device)
{
  return get(device, "/Sync", {{"remove", device.address}});
}

Response PlayerController::admin_post(const Device &device, const std::string &endpoint, const std::string &body)
{
  CallOptions options;
  options.idempotent = false;
  options.port = DEVICE_ADMIN_PORT;
  options.body = body;
  return executor_.execute(device, endpoint, HttpMethod::Post, QueryParams(), options_.command_timeout, options);
}

Response PlayerController::reboot(const Device &device)
{
  LOG("Soft reboot requested for " << device.address);
  return admin_post(device, "/Reboot", "soft=1");
}

Response PlayerController::hard_reboot(const Device &device)
{
  LOG_WARN("Hard reboot requested for " << device.address);
  return admin_post(device, "/reboot", "yes=1");
}

std::optional<std::string> PlayerController::system_uptime(const Device &device)
{
  CallOptions options;
  options.port = DEVICE_ADMIN_PORT;
  Response response =
      executor_.execute(device, "/diagnostics", HttpMethod::Get, QueryParams(), options_.status_timeout, options);
  return decode_system_uptime(response.body);
}

std::string PlayerController::raw(const Device &device, const std::string &endpoint)
{
  return get(device, endpoint, QueryParams(), true).body;
}

std::map<std::string, Outcome<PlayerStatus>> PlayerController::status_all(const std::vector<Device> &devices)
{
  std::function<PlayerStatus(const Device &, int &)> operation = [this](const Device &device, int &attempts) {
    return status(device, &attempts);
  };
  return dispatcher_.dispatch<PlayerStatus>(devices, OperationClass::Command, operation);
}

std::map<std::string, CommandOutcome> PlayerController::run_all(const std::vector<Device> &devices,
                                                                const DeviceCommand &command)
{
  std::function<std::string(const Device &, int &)> operation = [&command](const Device &device, int &attempts) {
    Response response = command(device);
    attempts = response.attempts;
    return response.body;
  };
  return dispatcher_.dispatch<std::string>(devices, OperationClass::Command, operation);
}

} // namespace bluos
