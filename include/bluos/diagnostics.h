#pragma once

#include "bluos/device.h"
#include "bluos/network_stats.h"
#include "bluos/player_controller.h"
#include "bluos/process_runner.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bluos
{

static const size_t MAX_ARP_OUTPUT = 1000;
static const std::chrono::milliseconds ARP_TIMEOUT(2000);

// First MAC address in `arp -n <ip>` output, lower-cased. Handles the Linux
// table layout and the BSD "? (ip) at mac on if" line. Empty when there is
// none or the output is implausibly large.
std::string parse_arp_mac(const std::string &output);

struct DeviceDiagnostics
{
  Device device;
  std::string arp_mac;
  std::optional<std::string> uptime;
  NetworkStatsStatus network_status = NetworkStatsStatus::Skipped;
  std::optional<NetworkClient> client;
  std::string sync_status;         // /SyncStatus body as served
  std::vector<std::string> errors; // "<step>: <message>" per failed step
};

// Everything known about one player, gathered step by step. A failing step
// is recorded and the rest still run.
class Diagnostics
{
public:
  Diagnostics(PlayerController &players, ProcessRunner &runner, UnifiStatsProvider &network_stats);

  DeviceDiagnostics collect(const Device &device);

  std::string arp_mac(const std::string &address);

private:
  PlayerController &players_;
  ProcessRunner &runner_;
  UnifiStatsProvider &network_stats_;
};

} // namespace bluos
