#include "bluos/context.h"
#include "bluos/errors.h"
#include "bluos/logging.h"
#include "bluos/status_json.h"
#include "bluos/validators.h"
#include "string_util.h"

#include <CLI/CLI.hpp>

#include <termios.h>
#include <unistd.h>

#include <functional>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace bluos;

namespace
{

const int EXIT_OK = 0;
const int EXIT_FAILED = 1;
const int EXIT_USAGE = 2;

struct CliOptions
{
  std::string config_path;
  bool verbose = false;
  bool refresh = false;
  std::string target;
  std::string volume;
  int preset_id = 0;
  std::string input;
  int bluetooth_mode = -1;
  bool clear_queue = false;
  std::vector<int> move;
  std::string sync_master;
  std::vector<std::string> sync_slaves;
  bool json = false;
  bool hard = false;
  bool yes = false;
};

// Reads one line from the terminal. With echo off the typed text is not
// shown, for secrets.
std::string prompt_line(const std::string &prompt, bool echo = true)
{
  std::cout << prompt << std::flush;

  struct termios saved;
  bool restore = false;
  if (!echo && isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0)
  {
    struct termios quiet = saved;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    restore = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
  }

  std::string line;
  if (!std::getline(std::cin, line))
    line.clear();

  if (restore)
  {
    tcsetattr(STDIN_FILENO, TCSANOW, &saved);
    std::cout << "\n";
  }
  return trim(line);
}

bool confirm(const std::string &question, bool assume_yes)
{
  if (assume_yes)
    return true;
  return to_lower(prompt_line(question + " Confirm (y/N): ")) == "y";
}

std::string describe(const ErrorInfo &error)
{
  return std::string(error_kind_name(error.kind)) + ": " + error.message;
}

// Prints one line per device and returns the process exit status.
template <typename T>
int report(const std::map<std::string, Outcome<T>> &outcomes,
           const std::function<void(const Device &, const T &)> &print)
{
  int status = EXIT_OK;
  for (const auto &pair : outcomes)
  {
    const Outcome<T> &outcome = pair.second;
    if (outcome.ok)
    {
      print(outcome.device, *outcome.value);
    }
    else
    {
      status = EXIT_FAILED;
      std::cout << "[FAILED] " << outcome.device.display_name() << " (" << outcome.device.address
                << "): " << describe(outcome.error) << "\n";
    }
  }
  return status;
}

int report_commands(const std::map<std::string, CommandOutcome> &outcomes, const std::string &label)
{
  std::function<void(const Device &, const std::string &)> print = [&label](const Device &device,
                                                                            const std::string &) {
    std::cout << "[" << label << "] " << device.display_name() << "\n";
  };
  return report<std::string>(outcomes, print);
}

std::string format_bytes(uint64_t bytes)
{
  static const char *const units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4)
  {
    value /= 1024.0;
    unit++;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
  return out.str();
}

class Commands
{
public:
  Commands(Context &ctx, const CliOptions &options) : ctx_(ctx), options_(options) {}

  int discover()
  {
    DiscoveryResult result = ctx_.discovery().lookup(options_.refresh);
    if (result.empty())
    {
      std::cout << "No devices found.\n";
      return EXIT_FAILED;
    }

    std::cout << "Devices (" << source_tag_name(result.source) << (result.stale ? ", stale" : "") << "):\n";
    for (const auto &device : result.devices)
    {
      std::cout << "  " << std::left << std::setw(16) << device.address << " "
                << device.display_name();
      if (!device.model.empty())
        std::cout << "  [" << device.model << "]";
      std::cout << "\n";
    }
    return EXIT_OK;
  }

  int status()
  {
    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;

    std::map<std::string, NetworkClient> clients;
    if (ctx_.settings().unifi.enabled)
    {
      std::vector<std::string> addresses;
      for (const auto &device : devices)
        addresses.push_back(device.address);
      NetworkStats stats = ctx_.network_stats().fetch(addresses);
      if (!options_.json)
        std::cout << "Network stats: " << stats.summary() << "\n";
      clients = stats.clients;
    }

    std::map<std::string, Outcome<PlayerStatus>> outcomes = ctx_.players().status_all(devices);
    if (options_.json)
    {
      std::cout << status_to_json(outcomes, clients) << "\n";
      for (const auto &pair : outcomes)
      {
        if (!pair.second.ok)
          return EXIT_FAILED;
      }
      return EXIT_OK;
    }

    std::function<void(const Device &, const PlayerStatus &)> print = [&clients](const Device &device,
                                                                                 const PlayerStatus &s) {
      std::cout << s.sync.name << " (" << device.address << ")";
      std::string model = s.sync.full_model();
      if (!model.empty())
        std::cout << "  " << model;
      if (!s.sync.firmware.empty())
        std::cout << "  fw " << s.sync.firmware;
      std::cout << "\n";

      std::cout << "  " << play_state_name(s.playback.state) << "  vol " << s.playback.volume
                << (s.playback.muted ? " (muted)" : "") << "  " << s.playback.service << "\n";
      if (!s.playback.title.empty())
      {
        std::cout << "  " << s.playback.title;
        if (!s.playback.artist.empty())
          std::cout << " - " << s.playback.artist;
        if (!s.playback.album.empty())
          std::cout << " (" << s.playback.album << ")";
        std::cout << "\n";
      }
      if (s.sync.role != SyncRole::Standalone)
      {
        std::cout << "  group " << sync_role_name(s.sync.role);
        if (!s.sync.master.empty())
          std::cout << " of " << s.sync.master;
        for (const auto &slave : s.sync.slaves)
          std::cout << " +" << slave;
        std::cout << "\n";
      }
      if (s.sync.battery)
        std::cout << "  battery " << *s.sync.battery << "%\n";

      auto client = clients.find(device.address);
      if (client != clients.end())
      {
        const NetworkClient &c = client->second;
        std::cout << "  " << (c.wired ? "wired" : "wireless") << " via " << c.uplink;
        if (!c.port_info.empty())
          std::cout << " (" << c.port_info << ")";
        std::cout << "  down " << format_bytes(c.down_total) << "  up " << format_bytes(c.up_total) << "\n";
      }
    };
    return report<PlayerStatus>(outcomes, print);
  }

  int transport(PlayerCommand command)
  {
    PlayerController &players = ctx_.players();
    return run(to_upper(player_command_name(command)),
               [&players, command](const Device &d) { return players.send(d, command); });
  }

  int volume()
  {
    PlayerController &players = ctx_.players();
    const std::string &arg = options_.volume;

    if (arg == "mute")
      return run("MUTED", [&players](const Device &d) { return players.set_muted(d, true); });
    if (arg == "unmute")
      return run("UNMUTED", [&players](const Device &d) { return players.set_muted(d, false); });
    if (arg == "reset")
      return run("RESET", [&players](const Device &d) { return players.reset_volume(d); });

    long value = 0;
    if (!parse_long(arg, value))
    {
      std::cerr << "Invalid volume: " << arg << "\n";
      return EXIT_USAGE;
    }
    if (arg[0] == '+' || arg[0] == '-')
    {
      int delta = static_cast<int>(clamp_value(value, -MAX_VOLUME, MAX_VOLUME));
      return run("VOL " + arg, [&players, delta](const Device &d) { return players.adjust_volume(d, delta); });
    }
    if (value < MIN_VOLUME || value > MAX_VOLUME)
    {
      std::cerr << "Volume must be " << MIN_VOLUME << ".." << MAX_VOLUME << "\n";
      return EXIT_USAGE;
    }
    int level = static_cast<int>(value);
    return run("VOL " + std::to_string(level), [&players, level](const Device &d) {
      return players.set_volume(d, level);
    });
  }

  int queue()
  {
    PlayerController &players = ctx_.players();
    if (options_.clear_queue)
      return run("CLEARED", [&players](const Device &d) { return players.clear_queue(d); });
    if (options_.move.size() == 2)
    {
      int from = options_.move[0];
      int to = options_.move[1];
      return run("MOVED", [&players, from, to](const Device &d) { return players.move_queue_item(d, from, to); });
    }

    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;
    std::function<std::vector<QueueItem>(const Device &)> fetch = [&players](const Device &d) {
      return players.queue(d);
    };
    std::function<void(const Device &, const std::vector<QueueItem> &)> print =
        [](const Device &device, const std::vector<QueueItem> &items) {
          std::cout << device.display_name() << ": " << items.size() << " tracks\n";
          for (size_t i = 0; i < items.size(); i++)
          {
            std::cout << "  " << std::setw(3) << i << "  " << items[i].title;
            if (!items[i].artist.empty())
              std::cout << " - " << items[i].artist;
            std::cout << "\n";
          }
        };
    return report<std::vector<QueueItem>>(
        ctx_.dispatcher().dispatch<std::vector<QueueItem>>(devices, OperationClass::Command, fetch), print);
  }

  int presets()
  {
    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;
    PlayerController &players = ctx_.players();
    std::function<std::vector<PresetInfo>(const Device &)> fetch = [&players](const Device &d) {
      return players.presets(d);
    };
    std::function<void(const Device &, const std::vector<PresetInfo> &)> print =
        [](const Device &device, const std::vector<PresetInfo> &presets) {
          std::cout << device.display_name() << ":\n";
          for (const auto &preset : presets)
            std::cout << "  " << std::setw(3) << preset.id << "  " << preset.name << "\n";
        };
    return report<std::vector<PresetInfo>>(
        ctx_.dispatcher().dispatch<std::vector<PresetInfo>>(devices, OperationClass::Command, fetch), print);
  }

  int preset()
  {
    PlayerController &players = ctx_.players();
    int id = options_.preset_id;
    return run("PRESET " + std::to_string(id), [&players, id](const Device &d) { return players.play_preset(d, id); });
  }

  int inputs()
  {
    PlayerController &players = ctx_.players();
    if (!options_.input.empty())
    {
      std::string input = options_.input;
      return run("INPUT " + input, [&players, input](const Device &d) { return players.select_input(d, input); });
    }

    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;
    std::function<std::vector<InputInfo>(const Device &)> fetch = [&players](const Device &d) {
      return players.inputs(d);
    };
    std::function<void(const Device &, const std::vector<InputInfo> &)> print =
        [](const Device &device, const std::vector<InputInfo> &inputs) {
          std::cout << device.display_name() << ":\n";
          for (const auto &input : inputs)
            std::cout << "  " << (input.selected ? "* " : "  ") << input.name << "  " << input.type << "\n";
        };
    return report<std::vector<InputInfo>>(
        ctx_.dispatcher().dispatch<std::vector<InputInfo>>(devices, OperationClass::Command, fetch), print);
  }

  int bluetooth()
  {
    PlayerController &players = ctx_.players();
    if (options_.bluetooth_mode >= 0)
    {
      BluetoothMode mode = static_cast<BluetoothMode>(options_.bluetooth_mode);
      return run(std::string("BLUETOOTH ") + bluetooth_mode_name(mode),
                 [&players, mode](const Device &d) { return players.set_bluetooth_mode(d, mode); });
    }

    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;
    std::function<BluetoothMode(const Device &)> fetch = [&players](const Device &d) {
      return players.bluetooth_mode(d);
    };
    std::function<void(const Device &, const BluetoothMode &)> print = [](const Device &device,
                                                                         const BluetoothMode &mode) {
      std::cout << device.display_name() << ": " << bluetooth_mode_name(mode) << "\n";
    };
    return report<BluetoothMode>(
        ctx_.dispatcher().dispatch<BluetoothMode>(devices, OperationClass::Command, fetch), print);
  }

  int sync_change(bool add)
  {
    DiscoveryResult result = ctx_.discovery().lookup(options_.refresh);
    GroupChange change = plan_group_change(result.devices, options_.sync_master, options_.sync_slaves);
    PlayerController &players = ctx_.players();

    int status = EXIT_OK;
    for (const auto &slave : change.slaves)
    {
      try
      {
        if (add)
          players.add_slave(change.master, slave);
        else
          players.remove_slave(change.master, slave);
        std::cout << "[" << (add ? "ADDED" : "REMOVED") << "] " << slave << (add ? " -> " : " <- ")
                  << change.master.display_name() << "\n";
      }
      catch (const Error &e)
      {
        status = EXIT_FAILED;
        std::cout << "[FAILED] " << slave << ": " << describe(to_error_info(e)) << "\n";
      }
    }
    return status;
  }

  int sync_list()
  {
    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;

    std::map<std::string, std::string> names;
    for (const auto &device : devices)
      names[device.address] = device.display_name();

    std::function<void(const Device &, const PlayerStatus &)> print = [&names](const Device &device,
                                                                               const PlayerStatus &s) {
      std::cout << device.display_name();
      if (s.sync.role == SyncRole::Slave)
      {
        auto master = names.find(s.sync.master);
        std::cout << " -> " << (master != names.end() ? master->second : s.sync.master) << " (slave)";
      }
      else if (s.sync.role == SyncRole::Master)
      {
        std::cout << " (master of " << s.sync.slaves.size() << ")";
      }
      else
      {
        std::cout << " (standalone)";
      }
      std::cout << "\n";
    };
    return report<PlayerStatus>(ctx_.players().status_all(devices), print);
  }

  int sync_break()
  {
    PlayerController &players = ctx_.players();
    return run("UNGROUPED", [&players](const Device &d) { return players.leave_group(d); });
  }

  int reboot()
  {
    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;

    std::string scope = options_.target.empty() ? "ALL" : "'" + options_.target + "'";
    std::string kind = options_.hard ? "Hard reboot" : "Soft reboot";
    if (!confirm(kind + " " + scope + " (" + std::to_string(devices.size()) + " devices)?", options_.yes))
    {
      std::cout << "Cancelled.\n";
      return EXIT_FAILED;
    }

    PlayerController &players = ctx_.players();
    if (options_.hard)
      return report_commands(players.run_all(devices, [&players](const Device &d) { return players.hard_reboot(d); }),
                             "REBOOTING");
    return report_commands(players.run_all(devices, [&players](const Device &d) { return players.reboot(d); }),
                           "REBOOTING");
  }

  int diagnose()
  {
    DiscoveryResult result = ctx_.discovery().lookup(options_.refresh);
    Device device = match_one_device(result.devices, options_.target);
    DeviceDiagnostics report = ctx_.diagnostics().collect(device);

    std::cout << "Diagnostics for " << device.display_name() << "\n";
    std::cout << "IP address:  " << device.address << "\n";
    std::cout << "ARP MAC:     " << (report.arp_mac.empty() ? "Unknown" : report.arp_mac) << "\n";
    std::cout << "Sys uptime:  " << report.uptime.value_or("N/A") << "\n";
    if (report.client)
    {
      std::cout << "UniFi:       FOUND, " << (report.client->wired ? "wired" : "wireless") << " via "
                << report.client->uplink << ", connected " << report.client->uptime << "s\n";
    }
    else
    {
      std::cout << "UniFi:       not found (" << network_stats_status_name(report.network_status) << ")\n";
    }
    for (const auto &error : report.errors)
      std::cout << "Failed:      " << error << "\n";

    std::cout << "\n/SyncStatus:\n" << report.sync_status << "\n";
    return report.errors.empty() ? EXIT_OK : EXIT_FAILED;
  }

  int keychain(const std::string &action)
  {
    KeychainSecretStore &store = ctx_.keychain();
    if (!store.available())
    {
      std::cerr << "Keychain access is only available on macOS.\n";
      return EXIT_FAILED;
    }

    if (action == "set")
    {
      std::string key = prompt_line("UniFi API key: ", false);
      if (key.empty())
      {
        std::cerr << "API key cannot be empty.\n";
        return EXIT_USAGE;
      }
      if (!store.store(UNIFI_API_KEY_SECRET, key))
      {
        std::cerr << "Failed to store the API key in the keychain.\n";
        return EXIT_FAILED;
      }
      std::cout << "API key stored in the keychain. It takes precedence over UNIFI_API_KEY in the config.\n";
      return EXIT_OK;
    }

    if (action == "get")
    {
      std::string key = store.resolve(UNIFI_API_KEY_SECRET);
      if (!key.empty())
      {
        std::cout << "Keychain: " << mask_secret(key) << " (" << key.size() << " characters)\n";
        return EXIT_OK;
      }
      std::cout << "No API key in the keychain.\n";
      if (!trim(ctx_.settings().unifi.api_key).empty())
      {
        std::cout << "The config file has one.\n";
        return EXIT_OK;
      }
      std::cout << "The config file has none either.\n";
      return EXIT_FAILED;
    }

    if (!confirm("Remove the UniFi API key from the keychain?", options_.yes))
    {
      std::cout << "Cancelled.\n";
      return EXIT_FAILED;
    }
    if (!store.remove(UNIFI_API_KEY_SECRET))
    {
      std::cerr << "Failed to remove the API key from the keychain.\n";
      return EXIT_FAILED;
    }
    std::cout << "API key removed from the keychain.\n";
    return EXIT_OK;
  }

private:
  bool targets(std::vector<Device> &devices)
  {
    DiscoveryResult result = ctx_.discovery().lookup(options_.refresh);
    if (result.stale)
      std::cerr << "Using stale device list from cache\n";
    devices = match_devices(result.devices, options_.target);
    if (devices.empty())
    {
      std::cout << "No matching devices found.\n";
      return false;
    }
    return true;
  }

  int run(const std::string &label, const PlayerController::DeviceCommand &command)
  {
    std::vector<Device> devices;
    if (!targets(devices))
      return EXIT_FAILED;
    return report_commands(ctx_.players().run_all(devices, command), label);
  }

  Context &ctx_;
  const CliOptions &options_;
};

void add_target(CLI::App *cmd, CliOptions &options)
{
  cmd->add_option("target", options.target, "Device name or part of it (default: all)");
}

} // namespace

int main(int argc, char **argv)
{
  CLI::App app{"BluOS multi-room player control"};
  app.require_subcommand(1);

  CliOptions options;
  options.config_path = default_config_path();
  app.add_option("-c,--config", options.config_path, "Configuration file");
  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging");
  app.add_flag("-r,--refresh", options.refresh, "Ignore the device cache");

  CLI::App *discover = app.add_subcommand("discover", "List players on the network");
  discover->add_flag("--refresh", options.refresh, "Ignore the device cache");

  CLI::App *status = app.add_subcommand("status", "Show player state");
  add_target(status, options);
  status->add_flag("--json", options.json, "Print a JSON array instead of text");

  std::map<CLI::App *, PlayerCommand> transport;
  for (PlayerCommand command : {PlayerCommand::Play, PlayerCommand::Pause, PlayerCommand::Stop, PlayerCommand::Skip,
                                PlayerCommand::Back, PlayerCommand::Toggle})
  {
    CLI::App *cmd = app.add_subcommand(player_command_name(command), "Send a transport command");
    add_target(cmd, options);
    transport[cmd] = command;
  }

  CLI::App *volume = app.add_subcommand("volume", "Set, adjust, mute or reset the volume");
  volume->add_option("level", options.volume, "0-100, +N, -N, mute, unmute or reset (use -- before -N)")->required();
  add_target(volume, options);

  CLI::App *queue = app.add_subcommand("queue", "Show or edit the play queue");
  add_target(queue, options);
  CLI::Option *clear = queue->add_flag("--clear", options.clear_queue, "Remove every track");
  queue->add_option("--move", options.move, "Move the track at FROM to TO")->expected(2)->excludes(clear);

  CLI::App *inputs = app.add_subcommand("inputs", "List or select audio inputs");
  add_target(inputs, options);
  inputs->add_option("--select", options.input, "Input name to select");

  CLI::App *bluetooth = app.add_subcommand("bluetooth", "Show or set the bluetooth mode");
  add_target(bluetooth, options);
  bluetooth->add_option("--mode", options.bluetooth_mode,
                        "0 manual, 1 automatic, 2 guest, 3 disabled")->check(CLI::Range(0, 3));

  CLI::App *presets = app.add_subcommand("presets", "List presets");
  add_target(presets, options);

  CLI::App *preset = app.add_subcommand("preset", "Play a preset");
  preset->add_option("id", options.preset_id, "Preset number")->required()->check(CLI::PositiveNumber);
  add_target(preset, options);

  CLI::App *sync = app.add_subcommand("sync", "Manage player groups");
  sync->require_subcommand(1);
  CLI::App *sync_add = sync->add_subcommand("add", "Group players under a master");
  CLI::App *sync_remove = sync->add_subcommand("remove", "Take players out of a master's group");
  for (CLI::App *cmd : {sync_add, sync_remove})
  {
    cmd->add_option("master", options.sync_master, "Name or address of exactly one master")->required();
    cmd->add_option("players", options.sync_slaves, "Names or addresses of the other players")->required();
  }
  CLI::App *sync_list = sync->add_subcommand("list", "Show the group role of every player");
  add_target(sync_list, options);
  CLI::App *sync_break = sync->add_subcommand("break", "Make players leave their groups");
  add_target(sync_break, options);

  CLI::App *reboot = app.add_subcommand("reboot", "Reboot players");
  add_target(reboot, options);
  reboot->add_flag("--hard", options.hard, "Full power cycle instead of a soft reboot");
  reboot->add_flag("-y,--yes", options.yes, "Do not ask for confirmation");

  CLI::App *diagnose = app.add_subcommand("diagnose", "Collect diagnostics for one player");
  diagnose->add_option("target", options.target, "Device name or address")->required();

  CLI::App *keychain = app.add_subcommand("keychain", "Manage the UniFi API key in the macOS keychain");
  std::string keychain_action;
  keychain->add_option("action", keychain_action, "set, get or delete")
      ->required()
      ->check(CLI::IsMember({"set", "get", "delete"}));
  keychain->add_flag("-y,--yes", options.yes, "Do not ask before deleting");

  try
  {
    app.parse(argc, argv);
  }
  catch (const CLI::ParseError &e)
  {
    int code = app.exit(e);
    return code == 0 ? EXIT_OK : EXIT_USAGE;
  }

  if (options.verbose)
  {
    enable_logging();
    set_log_threshold(LogLevel::Debug);
  }

  try
  {
    Context ctx(load_settings(options.config_path));
    Commands commands(ctx, options);

    if (discover->parsed())
      return commands.discover();
    if (status->parsed())
      return commands.status();
    for (const auto &pair : transport)
    {
      if (pair.first->parsed())
        return commands.transport(pair.second);
    }
    if (volume->parsed())
      return commands.volume();
    if (queue->parsed())
      return commands.queue();
    if (inputs->parsed())
      return commands.inputs();
    if (bluetooth->parsed())
      return commands.bluetooth();
    if (presets->parsed())
      return commands.presets();
    if (preset->parsed())
      return commands.preset();
    if (sync_add->parsed())
      return commands.sync_change(true);
    if (sync_remove->parsed())
      return commands.sync_change(false);
    if (sync_list->parsed())
      return commands.sync_list();
    if (sync_break->parsed())
      return commands.sync_break();
    if (reboot->parsed())
      return commands.reboot();
    if (diagnose->parsed())
      return commands.diagnose();
    if (keychain->parsed())
      return commands.keychain(keychain_action);
  }
  catch (const ValidationError &e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_USAGE;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_FAILED;
  }

  return EXIT_USAGE;
}
