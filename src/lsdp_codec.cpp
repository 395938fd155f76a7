#include "bluos/lsdp_codec.h"

#include "bluos/errors.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace bluos
{

static const char LSDP_MAGIC[4] = {'L', 'S', 'D', 'P'};

DeviceClass lsdp_device_class(uint16_t class_id)
{
  switch (class_id)
  {
  case LSDP_CLASS_PLAYER:
    return DeviceClass::Player;
  case LSDP_CLASS_SERVER:
    return DeviceClass::Server;
  case LSDP_CLASS_PLAYER_SECONDARY:
  case LSDP_CLASS_PLAYER_PAIR_SLAVE:
    return DeviceClass::SecondaryZone;
  case LSDP_CLASS_HUB:
    return DeviceClass::Hub;
  default:
    return DeviceClass::Unknown;
  }
}

namespace
{

// Bounds checked cursor over one message. Every read past the end is a
// ProtocolError, never an out of range access.
class FieldReader
{
public:
  FieldReader(const uint8_t *data, size_t length, const std::string &what)
      : data_(data), length_(length), offset_(0), what_(what) {}

  uint8_t u8()
  {
    need(1);
    return data_[offset_++];
  }

  uint16_t u16()
  {
    need(2);
    uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
  }

  std::string bytes(size_t count)
  {
    need(count);
    std::string value(reinterpret_cast<const char *>(data_ + offset_), count);
    offset_ += count;
    return value;
  }

  size_t remaining() const { return length_ - offset_; }

private:
  void need(size_t count) const
  {
    if (count > length_ - offset_)
    {
      throw ProtocolError("truncated " + what_ + " message");
    }
  }

  const uint8_t *data_;
  size_t length_;
  size_t offset_;
  std::string what_;
};

class FieldWriter
{
public:
  void u8(uint8_t v) { data_.push_back(v); }
  void u16(uint16_t v)
  {
    data_.push_back(static_cast<uint8_t>(v >> 8));
    data_.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  void short_string(const std::string &s)
  {
    if (s.size() > 0xFF)
      throw ValidationError("LSDP field longer than 255 bytes");
    u8(static_cast<uint8_t>(s.size()));
    data_.insert(data_.end(), s.begin(), s.end());
  }
  void raw(const std::string &s) { data_.insert(data_.end(), s.begin(), s.end()); }
  void count(size_t n)
  {
    if (n > 0xFF)
      throw ValidationError("LSDP list longer than 255 entries");
    u8(static_cast<uint8_t>(n));
  }

  std::vector<uint8_t> &data() { return data_; }

private:
  std::vector<uint8_t> data_;
};

std::string format_node_id(const std::string &raw)
{
  std::string out;
  out.reserve(raw.size() * 3);
  char hex[4];
  for (size_t i = 0; i < raw.size(); i++)
  {
    std::snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned char>(raw[i]));
    if (i > 0)
      out += ':';
    out += hex;
  }
  return out;
}

// Inverse of format_node_id; text that is not colon separated hex is sent
// as-is.
std::string parse_node_id(const std::string &text)
{
  std::string raw;
  size_t i = 0;
  while (i < text.size())
  {
    if (i + 2 > text.size())
      return text;
    char pair[3] = {text[i], text[i + 1], '\0'};
    char *end = nullptr;
    long value = std::strtol(pair, &end, 16);
    if (end != pair + 2)
      return text;
    raw.push_back(static_cast<char>(value));
    i += 2;
    if (i < text.size())
    {
      if (text[i] != ':')
        return text;
      i++;
    }
  }
  return raw;
}

std::string format_ipv4(const std::string &raw)
{
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                static_cast<unsigned char>(raw[0]), static_cast<unsigned char>(raw[1]),
                static_cast<unsigned char>(raw[2]), static_cast<unsigned char>(raw[3]));
  return buf;
}

std::string pack_ipv4(const std::string &dotted)
{
  unsigned int a, b, c, d;
  char trailing;
  if (std::sscanf(dotted.c_str(), "%u.%u.%u.%u%c", &a, &b, &c, &d, &trailing) != 4 ||
      a > 255 || b > 255 || c > 255 || d > 255)
  {
    return std::string();
  }
  std::string raw(4, '\0');
  raw[0] = static_cast<char>(a);
  raw[1] = static_cast<char>(b);
  raw[2] = static_cast<char>(c);
  raw[3] = static_cast<char>(d);
  return raw;
}

LsdpQuery parse_query(FieldReader &r, uint8_t type)
{
  LsdpQuery q;
  q.type = type;
  uint8_t count = r.u8();
  for (uint8_t i = 0; i < count; i++)
  {
    q.class_ids.push_back(r.u16());
  }
  return q;
}

LsdpAnnounce parse_announce(FieldReader &r, const std::string &source_ip)
{
  LsdpAnnounce a;
  a.node_id = format_node_id(r.bytes(r.u8()));

  uint8_t addr_len = r.u8();
  std::string addr = r.bytes(addr_len);
  a.address = addr_len == 4 ? format_ipv4(addr) : source_ip;

  uint8_t count = r.u8();
  for (uint8_t i = 0; i < count; i++)
  {
    LsdpRecord rec;
    rec.class_id = r.u16();
    uint8_t txt_count = r.u8();
    for (uint8_t t = 0; t < txt_count; t++)
    {
      std::string key = r.bytes(r.u8());
      std::string value = r.bytes(r.u8());
      rec.txt[key] = value;
    }
    a.records.push_back(std::move(rec));
  }
  return a;
}

LsdpDelete parse_delete(FieldReader &r)
{
  LsdpDelete d;
  d.node_id = format_node_id(r.bytes(r.u8()));
  uint8_t count = r.u8();
  for (uint8_t i = 0; i < count; i++)
  {
    d.class_ids.push_back(r.u16());
  }
  return d;
}

void append_message(std::vector<uint8_t> &packet, uint8_t type, const std::vector<uint8_t> &body)
{
  size_t length = body.size() + 2;
  if (length > 0xFF)
  {
    throw ValidationError("LSDP message longer than 255 bytes");
  }
  packet.push_back(static_cast<uint8_t>(length));
  packet.push_back(type);
  packet.insert(packet.end(), body.begin(), body.end());
}

} // namespace

std::vector<uint8_t> LsdpPacket::serialize() const
{
  std::vector<uint8_t> data;
  data.reserve(64);
  data.push_back(LSDP_HEADER_LENGTH);
  data.insert(data.end(), LSDP_MAGIC, LSDP_MAGIC + 4);
  data.push_back(LSDP_VERSION);

  for (const auto &q : queries)
  {
    FieldWriter w;
    w.count(q.class_ids.size());
    for (uint16_t id : q.class_ids)
      w.u16(id);
    append_message(data, q.type, w.data());
  }

  for (const auto &a : announces)
  {
    FieldWriter w;
    w.short_string(parse_node_id(a.node_id));
    std::string addr = pack_ipv4(a.address);
    w.short_string(addr);
    w.count(a.records.size());
    for (const auto &rec : a.records)
    {
      w.u16(rec.class_id);
      w.count(rec.txt.size());
      for (const auto &kv : rec.txt)
      {
        w.short_string(kv.first);
        w.short_string(kv.second);
      }
    }
    append_message(data, LSDP_MSG_ANNOUNCE, w.data());
  }

  for (const auto &d : deletes)
  {
    FieldWriter w;
    w.short_string(parse_node_id(d.node_id));
    w.count(d.class_ids.size());
    for (uint16_t id : d.class_ids)
      w.u16(id);
    append_message(data, LSDP_MSG_DELETE, w.data());
  }

  return data;
}

LsdpPacket LsdpPacket::deserialize(const uint8_t *buffer, size_t length, const std::string &source_ip)
{
  if (buffer == nullptr || length < LSDP_HEADER_LENGTH)
    throw ProtocolError("packet shorter than LSDP header", source_ip);
  if (length > LSDP_MAX_PACKET_SIZE)
    throw ProtocolError("packet exceeds " + std::to_string(LSDP_MAX_PACKET_SIZE) + " bytes", source_ip);
  if (buffer[0] != LSDP_HEADER_LENGTH)
    throw ProtocolError("unexpected LSDP header length " + std::to_string(buffer[0]), source_ip);
  if (memcmp(buffer + 1, LSDP_MAGIC, 4) != 0)
    throw ProtocolError("bad LSDP magic", source_ip);
  if (buffer[5] != LSDP_VERSION)
    throw ProtocolError("unsupported LSDP version " + std::to_string(buffer[5]), source_ip);

  LsdpPacket packet;
  size_t offset = LSDP_HEADER_LENGTH;
  if (offset == length)
    throw ProtocolError("LSDP packet carries no message", source_ip);

  while (offset < length)
  {
    // Declared lengths must tile the datagram exactly.
    size_t msg_length = buffer[offset];
    if (msg_length < 2)
      throw ProtocolError("LSDP message length " + std::to_string(msg_length) + " below minimum", source_ip);
    if (msg_length > length - offset)
      throw ProtocolError("LSDP message length exceeds received bytes", source_ip);

    uint8_t type = buffer[offset + 1];
    FieldReader r(buffer + offset + 2, msg_length - 2, std::string(1, static_cast<char>(type)));

    switch (type)
    {
    case LSDP_MSG_QUERY:
    case LSDP_MSG_QUERY_UNICAST:
      packet.queries.push_back(parse_query(r, type));
      break;
    case LSDP_MSG_ANNOUNCE:
      packet.announces.push_back(parse_announce(r, source_ip));
      break;
    case LSDP_MSG_DELETE:
      packet.deletes.push_back(parse_delete(r));
      break;
    default:
      packet.skipped_messages++;
      break;
    }

    offset += msg_length;
  }

  return packet;
}

std::vector<uint8_t> build_query_packet(const std::vector<uint16_t> &class_ids, uint8_t type)
{
  LsdpPacket packet;
  LsdpQuery q;
  q.type = type;
  q.class_ids = class_ids;
  packet.queries.push_back(q);
  return packet.serialize();
}

Device device_from_announce(const LsdpAnnounce &announce)
{
  Device device;
  device.address = announce.address;
  if (std::count(announce.node_id.begin(), announce.node_id.end(), ':') == 5 && announce.node_id.size() == 17)
  {
    device.mac = announce.node_id;
  }

  const LsdpRecord *best = nullptr;
  for (const auto &rec : announce.records)
  {
    if (!best || device_class_rank(lsdp_device_class(rec.class_id)) <
                     device_class_rank(lsdp_device_class(best->class_id)))
    {
      best = &rec;
    }
  }

  if (best)
  {
    device.device_class = lsdp_device_class(best->class_id);
    auto field = [&](const char *key) -> std::string {
      auto it = best->txt.find(key);
      return it == best->txt.end() ? std::string() : it->second;
    };
    device.name = field("name");
    device.model = field("model");
    device.brand = field("brand");
    std::string port = field("port");
    if (!port.empty())
    {
      char *end = nullptr;
      long value = std::strtol(port.c_str(), &end, 10);
      if (end && *end == '\0' && value > 0 && value <= 0xFFFF)
        device.port = static_cast<uint16_t>(value);
    }
  }
  return device;
}

} // namespace bluos
