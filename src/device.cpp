#include "bluos/device.h"
#include "bluos/errors.h"

#include "string_util.h"

#include <algorithm>
#include <map>

namespace bluos
{

const char *error_kind_name(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::ConnectionFailed:
    return "connection_failed";
  case ErrorKind::ConnectionReset:
    return "connection_reset";
  case ErrorKind::ServerError:
    return "server_error";
  case ErrorKind::ResolverFailed:
    return "resolver_failed";
  case ErrorKind::CircuitOpen:
    return "circuit_open";
  case ErrorKind::Protocol:
    return "protocol";
  case ErrorKind::Device:
    return "device";
  case ErrorKind::Cache:
    return "cache";
  }
  return "unknown";
}

const char *device_class_name(DeviceClass c)
{
  switch (c)
  {
  case DeviceClass::Player:
    return "player";
  case DeviceClass::Server:
    return "server";
  case DeviceClass::Hub:
    return "hub";
  case DeviceClass::SecondaryZone:
    return "secondary_zone";
  case DeviceClass::Unknown:
    break;
  }
  return "unknown";
}

DeviceClass device_class_from_name(const std::string &name)
{
  static const std::map<std::string, DeviceClass> classes = {
      {"player", DeviceClass::Player},
      {"server", DeviceClass::Server},
      {"hub", DeviceClass::Hub},
      {"secondary_zone", DeviceClass::SecondaryZone}};
  auto it = classes.find(to_lower(name));
  return it == classes.end() ? DeviceClass::Unknown : it->second;
}

int device_class_rank(DeviceClass c)
{
  switch (c)
  {
  case DeviceClass::Player:
    return 0;
  case DeviceClass::Hub:
    return 1;
  case DeviceClass::SecondaryZone:
    return 2;
  case DeviceClass::Server:
    return 3;
  case DeviceClass::Unknown:
    break;
  }
  return 4;
}

const char *discovery_method_name(DiscoveryMethod m)
{
  switch (m)
  {
  case DiscoveryMethod::Mdns:
    return "mdns";
  case DiscoveryMethod::Lsdp:
    return "lsdp";
  case DiscoveryMethod::Both:
    return "both";
  }
  return "mdns";
}

bool parse_discovery_method(const std::string &text, DiscoveryMethod &out)
{
  std::string value = to_lower(trim(text));
  if (value == "mdns")
    out = DiscoveryMethod::Mdns;
  else if (value == "lsdp")
    out = DiscoveryMethod::Lsdp;
  else if (value == "both")
    out = DiscoveryMethod::Both;
  else
    return false;
  return true;
}

const char *source_tag_name(DiscoverySourceTag tag)
{
  switch (tag)
  {
  case DiscoverySourceTag::Mdns:
    return "mdns";
  case DiscoverySourceTag::Lsdp:
    return "lsdp";
  case DiscoverySourceTag::None:
    break;
  }
  return "none";
}

DiscoverySourceTag source_tag_from_name(const std::string &name)
{
  std::string value = to_lower(name);
  if (value == "mdns")
    return DiscoverySourceTag::Mdns;
  if (value == "lsdp")
    return DiscoverySourceTag::Lsdp;
  return DiscoverySourceTag::None;
}

std::vector<Device> normalize_devices(std::vector<Device> devices)
{
  std::map<std::string, Device> by_address;
  for (auto &device : devices)
  {
    auto it = by_address.find(device.address);
    if (it == by_address.end())
    {
      by_address.emplace(device.address, std::move(device));
      continue;
    }

    Device &kept = it->second;
    int new_rank = device_class_rank(device.device_class);
    int kept_rank = device_class_rank(kept.device_class);
    if (new_rank < kept_rank || (new_rank == kept_rank && kept.name.empty() && !device.name.empty()))
    {
      kept = std::move(device);
    }
  }

  std::vector<Device> result;
  result.reserve(by_address.size());
  for (auto &pair : by_address)
  {
    result.push_back(std::move(pair.second));
  }
  return result;
}

std::vector<Device> match_devices(const std::vector<Device> &devices, const std::string &pattern)
{
  std::string needle = to_lower(trim(pattern));
  if (needle.empty())
    return devices;

  std::vector<Device> result;
  for (const auto &device : devices)
  {
    if (to_lower(device.name).find(needle) != std::string::npos || device.address == needle)
    {
      result.push_back(device);
    }
  }
  return result;
}

Device match_one_device(const std::vector<Device> &devices, const std::string &pattern)
{
  std::string needle = to_lower(trim(pattern));
  if (needle.empty())
    throw ValidationError("a device name or address is required");

  for (const auto &device : devices)
  {
    if (to_lower(device.name) == needle || device.address == needle)
      return device;
  }

  std::vector<Device> matches = match_devices(devices, needle);
  if (matches.empty())
    throw ValidationError("no device matches '" + pattern + "'");
  if (matches.size() > 1)
  {
    std::string names;
    for (const auto &device : matches)
      names += (names.empty() ? "" : ", ") + device.display_name();
    throw ValidationError("'" + pattern + "' matches " + std::to_string(matches.size()) + " devices: " + names);
  }
  return matches.front();
}

} // namespace bluos
