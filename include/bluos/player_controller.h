#pragma once

#include "bluos/device.h"
#include "bluos/dispatcher.h"
#include "bluos/request_executor.h"
#include "bluos/response_decoder.h"
#include "bluos/settings.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bluos
{

enum class PlayerCommand
{
  Play,
  Pause,
  Stop,
  Skip,
  Back,
  Toggle
};

const char *player_command_name(PlayerCommand command);
bool parse_player_command(const std::string &text, PlayerCommand &out);

struct PlayerStatus
{
  Device device;
  SyncSnapshot sync;
  StatusSnapshot playback;
};

struct ControllerOptions
{
  std::chrono::milliseconds status_timeout{3000};
  std::chrono::milliseconds command_timeout{2000};
  int safe_volume = DEFAULT_SAFE_VOLUME;
};

ControllerOptions controller_options(const Settings &settings);

struct GroupChange
{
  Device master;
  std::vector<std::string> slaves; // addresses, master excluded
};

// Resolves the master to exactly one known device and each slave, given by
// name or address, to an address. Throws ValidationError when a name is
// ambiguous or unknown, when no slave is given, or when the master is named
// as its own slave.
GroupChange plan_group_change(const std::vector<Device> &devices, const std::string &master,
                              const std::vector<std::string> &slaves);

// Player operations on the BluOS REST interface. Every call goes through
// the request executor; failures surface as bluos::Error. Command methods
// return the executor's Response so callers can report attempts.
class PlayerController
{
public:
  typedef std::function<Response(const Device &)> DeviceCommand;

  PlayerController(RequestExecutor &executor, const Dispatcher &dispatcher,
                   ControllerOptions options = ControllerOptions());

  // ProtocolError when either document is rejected by the decoder.
  PlayerStatus status(const Device &device, int *attempts = nullptr);

  Response send(const Device &device, PlayerCommand command);

  // ValidationError outside 0..100.
  Response set_volume(const Device &device, int level);
  // Relative to the current level, clamped to 0..100. Returns the new level
  // through new_level when given.
  Response adjust_volume(const Device &device, int delta, int *new_level = nullptr);
  Response set_muted(const Device &device, bool muted);
  Response reset_volume(const Device &device);

  std::vector<QueueItem> queue(const Device &device);
  Response clear_queue(const Device &device);
  Response move_queue_item(const Device &device, int from, int to);

  std::vector<InputInfo> inputs(const Device &device);
  Response select_input(const Device &device, const std::string &input);

  BluetoothMode bluetooth_mode(const Device &device);
  Response set_bluetooth_mode(const Device &device, BluetoothMode mode);

  std::vector<PresetInfo> presets(const Device &device);
  Response play_preset(const Device &device, int preset_id);

  Response add_slave(const Device &master, const std::string &slave_address);
  Response remove_slave(const Device &master, const std::string &slave_address);
  // Asks the player to drop out of its group (remove itself).
  Response leave_group(const Device &device);

  // Soft reboot on the admin port. Never retried.
  Response reboot(const Device &device);
  // Full power cycle on the admin port. Never retried.
  Response hard_reboot(const Device &device);

  // Uptime from the admin diagnostics page, nothing when the page has none.
  std::optional<std::string> system_uptime(const Device &device);
  // Undecoded body of a GET on the REST port.
  std::string raw(const Device &device, const std::string &endpoint);

  std::map<std::string, Outcome<PlayerStatus>> status_all(const std::vector<Device> &devices);
  std::map<std::string, CommandOutcome> run_all(const std::vector<Device> &devices, const DeviceCommand &command);

  const ControllerOptions &options() const { return options_; }

private:
  Response get(const Device &device, const std::string &endpoint, const QueryParams &params = QueryParams(),
               bool status_call = false);
  Response volume(const Device &device, const QueryParams &params);
  Response admin_post(const Device &device, const std::string &endpoint, const std::string &body);

  RequestExecutor &executor_;
  const Dispatcher &dispatcher_;
  ControllerOptions options_;
};

} // namespace bluos
