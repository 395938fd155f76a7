#include "bluos/response_decoder.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "bluos/xml_reader.h"
#include "log.h"
#include "string_util.h"

#include <cctype>
#include <set>

namespace bluos
{

const char *play_state_name(PlayState state)
{
  switch (state)
  {
  case PlayState::Play:
    return "play";
  case PlayState::Pause:
    return "pause";
  case PlayState::Stop:
    return "stop";
  case PlayState::Stream:
    return "stream";
  case PlayState::Connecting:
    return "connecting";
  case PlayState::Unknown:
    break;
  }
  return "unknown";
}

PlayState parse_play_state(const std::string &text)
{
  std::string s = to_lower(trim(text));
  if (s == "play")
    return PlayState::Play;
  if (s == "pause")
    return PlayState::Pause;
  if (s == "stop" || s.empty())
    return PlayState::Stop;
  if (s == "stream")
    return PlayState::Stream;
  if (s == "connecting")
    return PlayState::Connecting;
  return PlayState::Unknown;
}

const char *sync_role_name(SyncRole role)
{
  switch (role)
  {
  case SyncRole::Master:
    return "master";
  case SyncRole::Slave:
    return "slave";
  case SyncRole::Standalone:
    break;
  }
  return "standalone";
}

const char *bluetooth_mode_name(BluetoothMode mode)
{
  switch (mode)
  {
  case BluetoothMode::Manual:
    return "Manual";
  case BluetoothMode::Automatic:
    return "Automatic";
  case BluetoothMode::Guest:
    return "Guest";
  case BluetoothMode::Disabled:
    return "Disabled";
  case BluetoothMode::Unknown:
    break;
  }
  return "Unknown";
}

std::string SyncSnapshot::full_model() const
{
  if (!brand.empty() && model.find(brand) == std::string::npos)
    return brand + " " + model;
  return model;
}

namespace
{

std::optional<XmlElement> parse_or_log(const std::string &body, const std::string &address, const char *what)
{
  try
  {
    return parse_xml_document(body);
  }
  catch (const ProtocolError &e)
  {
    LOG_WARN("Rejected " << what << " from " << (address.empty() ? "device" : address) << ": " << e.what());
    return std::nullopt;
  }
}

void collect_extra(const XmlElement &root, const std::set<std::string> &known, ExtraFields &extra)
{
  for (const auto &child : root.children)
  {
    if (known.count(child.name) || extra.count(child.name))
      continue;
    extra[child.name] = trim(child.text);
  }
}

} // namespace

std::optional<StatusSnapshot> decode_status(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/Status");
  if (!root)
    return std::nullopt;

  static const std::set<std::string> known = {"volume", "mute", "state", "service", "title1",
                                              "title", "artist", "album"};

  StatusSnapshot s;
  long volume = 0;
  if (parse_long(root->child_text("volume"), volume))
    s.volume = clamp_volume(volume);
  s.muted = root->child_text("mute") == "1";
  s.state = parse_play_state(root->child_text("state"));

  std::string service = root->child_text("service");
  if (!service.empty())
    s.service = service == "Raat" ? "Roon" : service;

  s.title = root->child_text("title1");
  if (s.title.empty())
    s.title = root->child_text("title");
  s.artist = root->child_text("artist");
  s.album = root->child_text("album");

  collect_extra(*root, known, s.extra);
  return s;
}

std::optional<SyncSnapshot> decode_sync_status(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/SyncStatus");
  if (!root)
    return std::nullopt;

  static const std::set<std::string> known_attributes = {"name", "modelName", "model", "brand", "version",
                                                         "mac", "db", "master"};
  static const std::set<std::string> known_children = {"master", "slave", "battery"};

  SyncSnapshot s;
  std::string name = trim(root->attribute("name"));
  if (!name.empty())
    s.name = name;
  s.brand = root->attribute("brand");
  s.model = root->attribute("modelName");
  if (s.model.empty())
    s.model = root->attribute("model");
  if (s.model.empty())
    s.model = s.brand;
  s.firmware = root->attribute("version");
  s.mac = root->attribute("mac");
  s.signal_db = root->attribute("db");

  s.master = trim(root->attribute("master"));
  if (s.master.empty())
    s.master = root->child_text("master");

  for (const XmlElement *slave : root->children_named("slave"))
  {
    std::string id = trim(slave->attribute("id"));
    if (id.empty())
      id = trim(slave->text);
    if (!id.empty())
      s.slaves.push_back(id);
  }

  if (const XmlElement *battery = root->child("battery"))
    s.battery = battery->attribute("level");

  if (!s.master.empty())
    s.role = SyncRole::Slave;
  else if (!s.slaves.empty())
    s.role = SyncRole::Master;

  for (const auto &attr : root->attributes)
  {
    if (!known_attributes.count(attr.first))
      s.extra[attr.first] = attr.second;
  }
  collect_extra(*root, known_children, s.extra);
  return s;
}

std::optional<std::vector<QueueItem>> decode_queue(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/Queue");
  if (!root)
    return std::nullopt;

  std::vector<QueueItem> items;
  for (const auto &child : root->children)
  {
    if (child.name != "item" && child.name != "song")
      continue;
    QueueItem item;
    item.title = child.child_text("title");
    item.artist = child.child_text("artist");
    item.album = child.child_text("album");
    item.image = child.child_text("image");
    item.service = child.child_text("service");
    items.push_back(item);
  }
  return items;
}

std::optional<std::vector<InputInfo>> decode_inputs(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/AudioInputs");
  if (!root)
    return std::nullopt;

  std::vector<InputInfo> inputs;
  for (const XmlElement *element : root->children_named("input"))
  {
    InputInfo input;
    input.name = element->child_text("name");
    input.type = element->child_text("type");
    input.selected = element->attribute("selected") == "1";
    inputs.push_back(input);
  }
  return inputs;
}

std::optional<std::vector<PresetInfo>> decode_presets(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/Presets");
  if (!root)
    return std::nullopt;

  std::vector<PresetInfo> presets;
  for (const XmlElement *element : root->children_named("preset"))
  {
    PresetInfo preset;
    preset.id = element->attribute("id");
    preset.name = element->child_text("name");
    if (preset.name.empty())
      preset.name = element->attribute("name");
    preset.image = element->child_text("image");
    presets.push_back(preset);
  }
  return presets;
}

std::optional<BluetoothMode> decode_bluetooth_mode(const std::string &body, const std::string &address)
{
  std::optional<XmlElement> root = parse_or_log(body, address, "/AudioModes");
  if (!root)
    return std::nullopt;

  long mode = -1;
  if (!parse_long(root->child_text("bluetoothAutoplay"), mode) || mode < 0 || mode > 3)
    return BluetoothMode::Unknown;
  return static_cast<BluetoothMode>(mode);
}

// The page renders rows as <div>Uptime:</div><div class="...">3 days</div>.
std::optional<std::string> decode_system_uptime(const std::string &html)
{
  static const std::string label = "uptime:</div>";
  std::string lower = to_lower(html);

  size_t pos = lower.find(label);
  if (pos == std::string::npos)
    return std::nullopt;
  pos += label.size();
  while (pos < lower.size() && std::isspace(static_cast<unsigned char>(lower[pos])))
    pos++;
  if (lower.compare(pos, 4, "<div") != 0)
    return std::nullopt;

  size_t open_end = lower.find('>', pos);
  if (open_end == std::string::npos)
    return std::nullopt;
  size_t close = lower.find("</div>", open_end + 1);
  if (close == std::string::npos)
    return std::nullopt;

  std::string value = trim(html.substr(open_end + 1, close - open_end - 1));
  if (value.empty() || !is_valid_utf8(value))
    return std::nullopt;
  return value;
}

} // namespace bluos
