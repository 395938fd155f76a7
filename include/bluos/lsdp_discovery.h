#pragma once

#include "bluos/discovery_source.h"
#include "bluos/lsdp_codec.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace bluos
{

static const size_t LSDP_MAX_DEVICES = 1000;
static const size_t LSDP_MAX_PACKETS = 1000;

// Live node set for one LSDP pass. Announcements add or refresh a node,
// deletes remove it. Thread safe.
class LsdpCollector
{
public:
  struct Stats
  {
    size_t accepted = 0;
    size_t rejected = 0;
    size_t dropped = 0; // over the packet ceiling
  };

  // Returns false when the datagram was rejected or dropped. Never throws.
  bool handle_datagram(const uint8_t *data, size_t length, const std::string &source_ip);

  std::vector<Device> devices() const;
  Stats stats() const;
  size_t count() const;
  void clear();

private:
  void apply(const LsdpPacket &packet, const std::string &source_ip);

  mutable std::mutex mutex_;
  std::map<std::string, Device> nodes_; // keyed by node id
  Stats stats_;
};

struct LsdpOptions
{
  uint16_t port = LSDP_PORT;
  std::string broadcast_address = "255.255.255.255";
  std::vector<uint16_t> class_ids = {LSDP_CLASS_PLAYER, LSDP_CLASS_HUB};
};

// Broadcast query over UDP, collecting announcements until the deadline.
class LsdpDiscovery : public DiscoverySource
{
public:
  explicit LsdpDiscovery(LsdpOptions options = LsdpOptions());

  std::vector<Device> discover(std::chrono::milliseconds timeout) override;
  DiscoverySourceTag tag() const override { return DiscoverySourceTag::Lsdp; }

  // Query send offsets from the start of a pass, before jitter.
  static const std::vector<std::chrono::milliseconds> &query_schedule();

private:
  LsdpOptions options_;
};

} // namespace bluos
