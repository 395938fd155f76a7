#pragma once

#include "bluos/discovery_source.h"
#include "bluos/host_resolver.h"
#include "bluos/process_runner.h"

#include <string>
#include <vector>

namespace bluos
{

static const char *const DEFAULT_MDNS_SERVICE = "_musc._tcp";

// One service instance reported by the OS resolver. Either the address is
// known, or the host still needs resolving.
struct MdnsCandidate
{
  std::string name;
  std::string host;
  std::string address;
  uint16_t port = DEVICE_PORT;
};

enum class MdnsBackend
{
  AvahiBrowse, // avahi-browse -rpt, Linux
  DnsSd        // dns-sd -Z, macOS
};

MdnsBackend default_mdns_backend();

// Decodes DNS-SD escapes: "\032" (decimal byte) and "\." style escapes.
std::string decode_dns_sd_escapes(const std::string &text);

// Parsers for resolver output. Malformed lines are skipped.
std::vector<MdnsCandidate> parse_avahi_output(const std::string &output, const std::string &service);
std::vector<MdnsCandidate> parse_dns_sd_output(const std::string &output, const std::string &service);

class MdnsDiscovery : public DiscoverySource
{
public:
  MdnsDiscovery(ProcessRunner &runner, HostResolver &resolver,
                std::string service = DEFAULT_MDNS_SERVICE,
                MdnsBackend backend = default_mdns_backend());

  std::vector<Device> discover(std::chrono::milliseconds timeout) override;
  DiscoverySourceTag tag() const override { return DiscoverySourceTag::Mdns; }

  std::vector<std::string> command_line() const;

private:
  ProcessRunner &runner_;
  HostResolver &resolver_;
  std::string service_;
  MdnsBackend backend_;
};

} // namespace bluos
