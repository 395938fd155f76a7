#pragma once

#include "bluos/device.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bluos
{

// Lenbrook Service Discovery Protocol, version 1.
static const uint16_t LSDP_PORT = 11430;
static const uint8_t LSDP_VERSION = 1;
static const uint8_t LSDP_HEADER_LENGTH = 6;
static const size_t LSDP_MAX_PACKET_SIZE = 4096;

static const uint16_t LSDP_CLASS_PLAYER = 0x0001;
static const uint16_t LSDP_CLASS_SERVER = 0x0002;
static const uint16_t LSDP_CLASS_PLAYER_SECONDARY = 0x0003;
static const uint16_t LSDP_CLASS_PLAYER_PAIR_SLAVE = 0x0006;
static const uint16_t LSDP_CLASS_HUB = 0x0008;
static const uint16_t LSDP_CLASS_ALL = 0xFFFF;

enum LsdpMessageType : uint8_t
{
  LSDP_MSG_QUERY = 0x51,         // 'Q', answered by broadcast
  LSDP_MSG_QUERY_UNICAST = 0x52, // 'R', answered by unicast
  LSDP_MSG_ANNOUNCE = 0x41,      // 'A'
  LSDP_MSG_DELETE = 0x44         // 'D'
};

DeviceClass lsdp_device_class(uint16_t class_id);

struct LsdpQuery
{
  uint8_t type = LSDP_MSG_QUERY;
  std::vector<uint16_t> class_ids;
};

struct LsdpRecord
{
  uint16_t class_id = 0;
  std::map<std::string, std::string> txt;
};

struct LsdpAnnounce
{
  std::string node_id;
  std::string address;
  std::vector<LsdpRecord> records;
};

struct LsdpDelete
{
  std::string node_id;
  std::vector<uint16_t> class_ids;
};

// One datagram. A packet may carry several messages; message kinds the
// decoder does not know are counted and skipped.
struct LsdpPacket
{
  std::vector<LsdpQuery> queries;
  std::vector<LsdpAnnounce> announces;
  std::vector<LsdpDelete> deletes;
  size_t skipped_messages = 0;

  std::vector<uint8_t> serialize() const;

  // Throws ProtocolError on anything that is not a well formed LSDP v1
  // datagram. source_ip stands in for announce records that carry no IPv4
  // address of their own.
  static LsdpPacket deserialize(const uint8_t *buffer, size_t length, const std::string &source_ip);
};

std::vector<uint8_t> build_query_packet(const std::vector<uint16_t> &class_ids,
                                        uint8_t type = LSDP_MSG_QUERY);

// One device per announce, using the most specific class advertised.
// Addresses are not validated here.
Device device_from_announce(const LsdpAnnounce &announce);

} // namespace bluos
