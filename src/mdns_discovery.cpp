#include "bluos/mdns_discovery.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"
#include "string_util.h"

#include <algorithm>
#include <regex>
#include <sstream>

namespace bluos
{

MdnsBackend default_mdns_backend()
{
#ifdef __APPLE__
  return MdnsBackend::DnsSd;
#else
  return MdnsBackend::AvahiBrowse;
#endif
}

std::string decode_dns_sd_escapes(const std::string &text)
{
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); i++)
  {
    if (text[i] != '\\' || i + 1 >= text.size())
    {
      out += text[i];
      continue;
    }
    if (i + 3 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isdigit(static_cast<unsigned char>(text[i + 2])) &&
        std::isdigit(static_cast<unsigned char>(text[i + 3])))
    {
      int value = (text[i + 1] - '0') * 100 + (text[i + 2] - '0') * 10 + (text[i + 3] - '0');
      if (value <= 255)
      {
        out += static_cast<char>(value);
        i += 3;
        continue;
      }
    }
    out += text[i + 1];
    i++;
  }
  return out;
}

static std::vector<std::string> split(const std::string &line, char sep)
{
  std::vector<std::string> fields;
  std::string field;
  std::istringstream in(line);
  while (std::getline(in, field, sep))
    fields.push_back(field);
  return fields;
}

static bool parse_port(const std::string &text, uint16_t &port)
{
  long value = 0;
  if (!parse_long(text, value) || value <= 0 || value > 0xFFFF)
    return false;
  port = static_cast<uint16_t>(value);
  return true;
}

// Resolved lines look like
// =;eth0;IPv4;Living\032Room;_musc._tcp;local;Living-Room.local;192.168.1.20;11000;"..."
std::vector<MdnsCandidate> parse_avahi_output(const std::string &output, const std::string &service)
{
  std::vector<MdnsCandidate> candidates;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line))
  {
    if (line.empty() || line[0] != '=')
      continue;
    std::vector<std::string> fields = split(line, ';');
    if (fields.size() < 9)
      continue;
    if (fields[2] != "IPv4" || fields[4] != service)
      continue;

    MdnsCandidate c;
    c.name = decode_dns_sd_escapes(fields[3]);
    c.host = fields[6];
    c.address = trim(fields[7]);
    if (!parse_port(fields[8], c.port))
      continue;
    candidates.push_back(c);
  }
  return candidates;
}

// SRV lines look like
// Living\032Room._musc._tcp    SRV    0 0 11000 Living-Room.local. ; Replace with unicast FQDN of target host
std::vector<MdnsCandidate> parse_dns_sd_output(const std::string &output, const std::string &service)
{
  static const std::regex srv_regex("^(\\S+)\\s+SRV\\s+\\d+\\s+\\d+\\s+(\\d+)\\s+(\\S+)");

  std::vector<MdnsCandidate> candidates;
  std::istringstream in(output);
  std::string line;
  const std::string suffix = "." + service;
  while (std::getline(in, line))
  {
    std::smatch m;
    if (!std::regex_search(line, m, srv_regex))
      continue;

    std::string instance = m[1].str();
    if (instance.size() > suffix.size() &&
        instance.compare(instance.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
      instance.erase(instance.size() - suffix.size());
    }

    MdnsCandidate c;
    c.name = decode_dns_sd_escapes(instance);
    c.host = m[3].str();
    while (!c.host.empty() && c.host.back() == '.')
      c.host.pop_back();
    if (!parse_port(m[2].str(), c.port))
      continue;
    candidates.push_back(c);
  }
  return candidates;
}

MdnsDiscovery::MdnsDiscovery(ProcessRunner &runner, HostResolver &resolver, std::string service, MdnsBackend backend)
    : runner_(runner), resolver_(resolver), service_(std::move(service)), backend_(backend) {}

std::vector<std::string> MdnsDiscovery::command_line() const
{
  if (backend_ == MdnsBackend::DnsSd)
    return {"dns-sd", "-Z", service_, "local"};
  return {"avahi-browse", "-rpt", service_};
}

std::vector<Device> MdnsDiscovery::discover(std::chrono::milliseconds timeout)
{
  if (!validate_service_name(service_))
  {
    LOG_WARN("Invalid mDNS service name: " << service_);
    return {};
  }

  // One deadline covers the browse and every host lookup. dns-sd runs until
  // killed and leaves hosts unresolved, so it yields a quarter of the
  // budget to resolution.
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto browse_timeout = backend_ == MdnsBackend::DnsSd ? timeout - timeout / 4 : timeout;

  ProcessResult result;
  try
  {
    result = runner_.run(command_line(), browse_timeout);
  }
  catch (const Error &e)
  {
    LOG_WARN("mDNS discovery unavailable: " << e.what());
    return {};
  }

  std::vector<MdnsCandidate> candidates = backend_ == MdnsBackend::DnsSd
                                              ? parse_dns_sd_output(result.output, service_)
                                              : parse_avahi_output(result.output, service_);
  LOG("mDNS browse returned " << candidates.size() << " candidates");

  std::vector<Device> devices;
  size_t unresolved = 0;
  for (const auto &c : candidates)
  {
    std::string address = c.address;
    if (address.empty())
    {
      if (!validate_hostname(c.host))
      {
        LOG("Skipping mDNS record with invalid host " << c.host);
        continue;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                             std::chrono::steady_clock::now());
      if (remaining.count() <= 0)
      {
        unresolved++;
        continue;
      }
      std::optional<std::string> resolved = resolver_.resolve(c.host, remaining);
      if (!resolved)
      {
        LOG("Could not resolve " << c.host);
        continue;
      }
      address = *resolved;
    }

    std::optional<std::string> ip = sanitize_ip(address);
    if (!ip)
    {
      LOG("Rejected mDNS address " << address << " for " << c.name);
      continue;
    }
    if (!is_valid_utf8(c.name))
    {
      LOG("Rejected mDNS record with invalid UTF-8 name from " << *ip);
      continue;
    }

    Device device;
    device.address = *ip;
    device.name = c.name;
    device.device_class = DeviceClass::Player;
    device.port = c.port;
    devices.push_back(device);
  }

  if (unresolved > 0)
  {
    LOG_WARN("mDNS discovery deadline passed with " << unresolved << " hosts unresolved");
  }
  return normalize_devices(std::move(devices));
}

} // namespace bluos
