#include "bluos/validators.h"

#include "bluos/errors.h"
#include "string_util.h"

#include <asio/ip/address_v4.hpp>

#include <regex>

namespace bluos
{

static bool parse_v4(const std::string &ip, asio::ip::address_v4 &out)
{
  // "255.255.255.255" is the longest literal; anything longer is not a
  // candidate and never reaches the parser.
  if (ip.empty() || ip.size() > 15)
    return false;
  if (ip.find_first_of(std::string("\0\r\n", 3)) != std::string::npos)
    return false;

  asio::error_code ec;
  out = asio::ip::make_address_v4(ip, ec);
  return !ec;
}

bool validate_ip(const std::string &ip)
{
  asio::ip::address_v4 addr;
  if (!parse_v4(ip, addr))
    return false;

  uint32_t value = addr.to_uint();
  if (addr.is_unspecified() || (value >> 24) == 0)
    return false; // 0.0.0.0/8
  if (addr.is_loopback())
    return false; // 127.0.0.0/8
  if (addr.is_multicast())
    return false; // 224.0.0.0/4
  if ((value & 0xF0000000u) == 0xF0000000u)
    return false; // 240.0.0.0/4, includes limited broadcast
  if ((value & 0xFFFF0000u) == 0xA9FE0000u)
    return false; // 169.254.0.0/16
  return true;
}

std::optional<std::string> sanitize_ip(const std::string &ip)
{
  std::string cleaned = trim(ip);
  if (validate_ip(cleaned))
    return cleaned;
  return std::nullopt;
}

bool validate_hostname(const std::string &hostname)
{
  if (hostname.empty() || hostname.size() > MAX_HOSTNAME_LENGTH)
    return false;

  static const std::string unsafe(";&|`$()<> \t\r\n\0", 14);
  if (hostname.find_first_of(unsafe) != std::string::npos)
    return false;

  static const std::regex hostname_regex(
      "^[a-zA-Z0-9]([a-zA-Z0-9\\-]{0,61}[a-zA-Z0-9])?(\\.[a-zA-Z0-9]([a-zA-Z0-9\\-]{0,61}[a-zA-Z0-9])?)*$");
  return std::regex_match(hostname, hostname_regex);
}

bool validate_service_name(const std::string &service)
{
  if (service.empty() || service.size() > MAX_HOSTNAME_LENGTH)
    return false;
  static const std::regex service_regex("^[a-zA-Z0-9._-]+$");
  return std::regex_match(service, service_regex);
}

bool is_local_address(const std::string &ip)
{
  if (!validate_ip(ip))
    return false;
  asio::ip::address_v4 addr;
  if (!parse_v4(ip, addr))
    return false;

  uint32_t value = addr.to_uint();
  return (value & 0xFF000000u) == 0x0A000000u ||  // 10.0.0.0/8
         (value & 0xFFF00000u) == 0xAC100000u ||  // 172.16.0.0/12
         (value & 0xFFFF0000u) == 0xC0A80000u ||  // 192.168.0.0/16
         (value & 0xFFC00000u) == 0x64400000u;    // 100.64.0.0/10
}

int require_volume(long volume)
{
  if (volume < MIN_VOLUME || volume > MAX_VOLUME)
  {
    throw ValidationError("volume " + std::to_string(volume) + " is outside " +
                          std::to_string(MIN_VOLUME) + ".." + std::to_string(MAX_VOLUME));
  }
  return static_cast<int>(volume);
}

int clamp_volume(long volume)
{
  return static_cast<int>(clamp_value(volume, MIN_VOLUME, MAX_VOLUME));
}

long clamp_value(long value, long min_val, long max_val)
{
  return std::max(min_val, std::min(max_val, value));
}

bool is_valid_utf8(const std::string &str)
{
  for (size_t i = 0; i < str.length();)
  {
    unsigned char c = str[i];
    size_t len = 0;

    if ((c & 0x80) == 0)
      len = 1;
    else if ((c & 0xE0) == 0xC0)
      len = 2;
    else if ((c & 0xF0) == 0xE0)
      len = 3;
    else if ((c & 0xF8) == 0xF0)
      len = 4;
    else
      return false;

    if (i + len > str.length())
      return false;

    for (size_t j = 1; j < len; j++)
    {
      if ((str[i + j] & 0xC0) != 0x80)
        return false;
    }

    i += len;
  }
  return true;
}

} // namespace bluos
