#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bluos
{

typedef std::map<std::string, std::string> ExtraFields;

enum class PlayState
{
  Play,
  Pause,
  Stop,
  Stream,
  Connecting,
  Unknown
};

const char *play_state_name(PlayState state);
PlayState parse_play_state(const std::string &text);

struct StatusSnapshot
{
  int volume = 0;
  bool muted = false;
  PlayState state = PlayState::Stop;
  std::string title;
  std::string artist;
  std::string album;
  std::string service = "Library/Input";
  ExtraFields extra;
};

enum class SyncRole
{
  Standalone,
  Master,
  Slave
};

const char *sync_role_name(SyncRole role);

struct SyncSnapshot
{
  std::string name = "Unknown";
  std::string model;
  std::string brand;
  std::string firmware;
  std::string mac;
  std::string signal_db;
  std::optional<std::string> battery;
  SyncRole role = SyncRole::Standalone;
  std::string master;
  std::vector<std::string> slaves;
  ExtraFields extra;

  // Brand prefixed to the model unless the model already names it.
  std::string full_model() const;
};

struct QueueItem
{
  std::string title;
  std::string artist;
  std::string album;
  std::string image;
  std::string service;
};

struct InputInfo
{
  std::string name;
  std::string type;
  bool selected = false;
};

struct PresetInfo
{
  std::string id;
  std::string name;
  std::string image;
};

enum class BluetoothMode
{
  Manual = 0,
  Automatic = 1,
  Guest = 2,
  Disabled = 3,
  Unknown = -1
};

const char *bluetooth_mode_name(BluetoothMode mode);

// Each decoder returns nothing when the document is rejected by the XML
// reader; the reason is logged against the device address.
std::optional<StatusSnapshot> decode_status(const std::string &body, const std::string &address = "");
std::optional<SyncSnapshot> decode_sync_status(const std::string &body, const std::string &address = "");
std::optional<std::vector<QueueItem>> decode_queue(const std::string &body, const std::string &address = "");
std::optional<std::vector<InputInfo>> decode_inputs(const std::string &body, const std::string &address = "");
std::optional<std::vector<PresetInfo>> decode_presets(const std::string &body, const std::string &address = "");
std::optional<BluetoothMode> decode_bluetooth_mode(const std::string &body, const std::string &address = "");

// Value of the "Uptime:" row on the HTML diagnostics page, tags stripped.
std::optional<std::string> decode_system_uptime(const std::string &html);

} // namespace bluos
