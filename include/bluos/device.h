#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bluos
{

static const uint16_t DEVICE_PORT = 11000;
static const uint16_t DEVICE_ADMIN_PORT = 80;

enum class DeviceClass
{
  Player,
  Server,
  Hub,
  SecondaryZone,
  Unknown
};

enum class DiscoveryMethod
{
  Mdns,
  Lsdp,
  Both
};

enum class DiscoverySourceTag
{
  Mdns,
  Lsdp,
  None
};

const char *device_class_name(DeviceClass c);
DeviceClass device_class_from_name(const std::string &name);
const char *discovery_method_name(DiscoveryMethod m);
bool parse_discovery_method(const std::string &text, DiscoveryMethod &out);
const char *source_tag_name(DiscoverySourceTag tag);
DiscoverySourceTag source_tag_from_name(const std::string &name);

// Lower rank wins when one address reports several classes.
int device_class_rank(DeviceClass c);

struct Device
{
  std::string address;
  std::string name;
  std::string model;
  std::string brand;
  DeviceClass device_class = DeviceClass::Unknown;
  std::string mac;
  uint16_t port = DEVICE_PORT;

  std::string display_name() const { return name.empty() ? address : name; }

  bool operator==(const Device &other) const
  {
    return address == other.address && name == other.name && model == other.model &&
           brand == other.brand && device_class == other.device_class &&
           mac == other.mac && port == other.port;
  }
  bool operator!=(const Device &other) const { return !(*this == other); }
};

struct DiscoveryResult
{
  std::vector<Device> devices;
  DiscoverySourceTag source = DiscoverySourceTag::None;
  std::chrono::system_clock::time_point captured_at = std::chrono::system_clock::now();
  bool stale = false;

  bool empty() const { return devices.empty(); }
};

// Sorts by address and keeps one record per address, preferring the most
// specific device class and then the record that carries a name.
std::vector<Device> normalize_devices(std::vector<Device> devices);

// Case-insensitive substring match on the device name; an empty pattern
// matches everything.
std::vector<Device> match_devices(const std::vector<Device> &devices, const std::string &pattern);

// The one device a name or address selects. An exact name or address wins
// over substring matches. Throws ValidationError when the pattern is empty
// or selects no device or several.
Device match_one_device(const std::vector<Device> &devices, const std::string &pattern);

} // namespace bluos
