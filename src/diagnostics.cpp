#include "bluos/diagnostics.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"
#include "string_util.h"

#include <cctype>
#include <sstream>

namespace bluos
{

namespace
{

bool is_mac_token(const std::string &token)
{
  int groups = 0;
  size_t digits = 0;
  for (char c : token)
  {
    if (c == ':')
    {
      if (digits == 0)
        return false;
      groups++;
      digits = 0;
    }
    else if (std::isxdigit(static_cast<unsigned char>(c)) && digits < 2)
    {
      digits++;
    }
    else
    {
      return false;
    }
  }
  return groups == 5 && digits > 0;
}

} // namespace

std::string parse_arp_mac(const std::string &output)
{
  if (output.size() > MAX_ARP_OUTPUT)
  {
    LOG_WARN("ARP output too large: " << output.size() << " bytes");
    return std::string();
  }

  std::istringstream in(output);
  std::string token;
  while (in >> token)
  {
    if (is_mac_token(token))
      return to_lower(token);
  }
  return std::string();
}

Diagnostics::Diagnostics(PlayerController &players, ProcessRunner &runner, UnifiStatsProvider &network_stats)
    : players_(players), runner_(runner), network_stats_(network_stats)
{
}

std::string Diagnostics::arp_mac(const std::string &address)
{
  if (!validate_ip(address))
  {
    LOG_WARN("Invalid address for ARP lookup: " << address);
    return std::string();
  }

  ProcessResult result = runner_.run({"arp", "-n", address}, ARP_TIMEOUT);
  if (result.timed_out)
  {
    LOG("ARP lookup for " << address << " timed out");
    return std::string();
  }
  if (result.exit_status != 0)
  {
    LOG("ARP lookup for " << address << " exited with " << result.exit_status);
    return std::string();
  }
  return parse_arp_mac(result.output);
}

DeviceDiagnostics Diagnostics::collect(const Device &device)
{
  DeviceDiagnostics report;
  report.device = device;

  try
  {
    report.arp_mac = arp_mac(device.address);
  }
  catch (const Error &e)
  {
    report.errors.push_back(std::string("arp: ") + e.what());
  }

  try
  {
    report.uptime = players_.system_uptime(device);
  }
  catch (const Error &e)
  {
    report.errors.push_back(std::string("diagnostics page: ") + e.what());
  }

  NetworkStats stats = network_stats_.fetch({device.address});
  report.network_status = stats.status;
  auto client = stats.clients.find(device.address);
  if (client != stats.clients.end())
    report.client = client->second;

  try
  {
    report.sync_status = players_.raw(device, "/SyncStatus");
  }
  catch (const Error &e)
  {
    report.errors.push_back(std::string("/SyncStatus: ") + e.what());
  }

  LOG("Diagnostics for " << device.address << " finished with " << report.errors.size() << " failed steps");
  return report;
}

} // namespace bluos
