#include "bluos/lsdp_discovery.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"
#include "socket_compat.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>

namespace bluos
{

bool LsdpCollector::handle_datagram(const uint8_t *data, size_t length, const std::string &source_ip)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stats_.accepted + stats_.rejected >= LSDP_MAX_PACKETS)
    {
      stats_.dropped++;
      return false;
    }
  }

  LsdpPacket packet;
  try
  {
    packet = LsdpPacket::deserialize(data, length, source_ip);
  }
  catch (const ProtocolError &e)
  {
    LOG("Dropped LSDP datagram from " << source_ip << ": " << e.what());
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.rejected++;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stats_.accepted++;
  apply(packet, source_ip);
  return true;
}

void LsdpCollector::apply(const LsdpPacket &packet, const std::string &source_ip)
{
  for (const auto &announce : packet.announces)
  {
    Device device = device_from_announce(announce);
    if (!validate_ip(device.address))
    {
      LOG("Rejected LSDP announce with invalid address " << device.address << " from " << source_ip);
      continue;
    }
    if (!is_valid_utf8(device.name) || !is_valid_utf8(device.model) || !is_valid_utf8(device.brand))
    {
      LOG("Rejected LSDP announce with invalid UTF-8 from " << source_ip);
      continue;
    }

    std::string key = announce.node_id.empty() ? device.address : announce.node_id;
    if (nodes_.size() >= LSDP_MAX_DEVICES && nodes_.find(key) == nodes_.end())
    {
      LOG("Rejected LSDP node " << key << ": device limit reached");
      continue;
    }

    auto it = nodes_.find(key);
    if (it == nodes_.end())
    {
      LOG("LSDP node discovered: " << key << " (" << device.display_name() << ") at " << device.address);
    }
    nodes_[key] = device;
  }

  for (const auto &del : packet.deletes)
  {
    if (nodes_.erase(del.node_id) > 0)
    {
      LOG("LSDP node removed: " << del.node_id);
    }
  }
}

std::vector<Device> LsdpCollector::devices() const
{
  std::vector<Device> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(nodes_.size());
    for (const auto &pair : nodes_)
    {
      result.push_back(pair.second);
    }
  }
  return normalize_devices(std::move(result));
}

LsdpCollector::Stats LsdpCollector::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

size_t LsdpCollector::count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.size();
}

void LsdpCollector::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  nodes_.clear();
  stats_ = Stats();
}

LsdpDiscovery::LsdpDiscovery(LsdpOptions options) : options_(std::move(options)) {}

const std::vector<std::chrono::milliseconds> &LsdpDiscovery::query_schedule()
{
  static const std::vector<std::chrono::milliseconds> schedule = {
      std::chrono::milliseconds(0), std::chrono::milliseconds(1000), std::chrono::milliseconds(2000),
      std::chrono::milliseconds(3000), std::chrono::milliseconds(5000), std::chrono::milliseconds(7000),
      std::chrono::milliseconds(10000)};
  return schedule;
}

static socket_t open_broadcast_socket(uint16_t port)
{
  ScopedSocket sock(socket(AF_INET, SOCK_DGRAM, 0));
  if (!sock.valid())
  {
    throw TransportError(ErrorKind::ConnectionFailed,
                         std::string("Failed to create LSDP socket: ") + std::strerror(errno));
  }

  int enable = 1;
  if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0)
  {
    throw TransportError(ErrorKind::ConnectionFailed, "Failed to enable SO_BROADCAST on LSDP socket");
  }
  if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0)
  {
    LOG("Warning: Failed to set SO_REUSEADDR for LSDP socket");
  }
#ifdef SO_REUSEPORT
  if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) < 0)
  {
    LOG("Warning: Failed to set SO_REUSEPORT for LSDP socket");
  }
#endif

  // Devices answer broadcast queries on the LSDP port. When another
  // listener holds it, fall back to an ephemeral port for unicast replies.
  struct sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;
  if (bind(sock.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
  {
    LOG("LSDP port " << port << " unavailable, using an ephemeral port");
    addr.sin_port = htons(0);
    if (bind(sock.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
    {
      throw TransportError(ErrorKind::ConnectionFailed,
                           std::string("Failed to bind LSDP socket: ") + std::strerror(errno));
    }
  }

  return sock.release();
}

std::vector<Device> LsdpDiscovery::discover(std::chrono::milliseconds timeout)
{
  using clock = std::chrono::steady_clock;

  LsdpCollector collector;
  ScopedSocket sock;
  try
  {
    sock.reset(open_broadcast_socket(options_.port));
  }
  catch (const TransportError &e)
  {
    LOG_WARN("LSDP discovery unavailable: " << e.what());
    return {};
  }

  std::vector<uint8_t> query = build_query_packet(options_.class_ids);

  struct sockaddr_in target = {};
  target.sin_family = AF_INET;
  target.sin_port = htons(options_.port);
  if (inet_pton(AF_INET, options_.broadcast_address.c_str(), &target.sin_addr) != 1)
  {
    LOG_WARN("Invalid LSDP broadcast address " << options_.broadcast_address);
    return {};
  }

  std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<int> jitter(0, 250);

  auto start = clock::now();
  auto deadline = start + timeout;

  std::vector<clock::time_point> sends;
  for (const auto &offset : query_schedule())
  {
    auto at = start + offset + std::chrono::milliseconds(offset.count() == 0 ? 0 : jitter(rng));
    if (at < deadline)
      sends.push_back(at);
  }
  size_t next_send = 0;

  LOG("LSDP discovery started, timeout " << timeout.count() << "ms");

  uint8_t buffer[LSDP_MAX_PACKET_SIZE + 1];
  while (true)
  {
    auto now = clock::now();
    if (now >= deadline)
      break;

    while (next_send < sends.size() && sends[next_send] <= now)
    {
      ssize_t sent = sendto(sock.get(), query.data(), query.size(), 0,
                            reinterpret_cast<struct sockaddr *>(&target), sizeof(target));
      if (sent != static_cast<ssize_t>(query.size()))
      {
        LOG("LSDP query send failed: " << std::strerror(errno));
      }
      next_send++;
    }

    auto wake = deadline;
    if (next_send < sends.size())
      wake = std::min(wake, sends[next_send]);
    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wake - now).count();

    struct pollfd pfd = {};
    pfd.fd = sock.get();
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, static_cast<int>(std::max<long long>(wait_ms, 1)));
    if (ready < 0)
    {
      if (errno == EINTR)
        continue;
      LOG_WARN("LSDP poll failed: " << std::strerror(errno));
      break;
    }
    if (ready == 0 || !(pfd.revents & POLLIN))
      continue;

    struct sockaddr_in sender = {};
    socklen_t sender_len = sizeof(sender);
    ssize_t received = recvfrom(sock.get(), buffer, sizeof(buffer), 0,
                                reinterpret_cast<struct sockaddr *>(&sender), &sender_len);
    if (received <= 0)
    {
      LOG("LSDP receive error: " << std::strerror(errno));
      continue;
    }

    char ip_str[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &sender.sin_addr, ip_str, INET_ADDRSTRLEN);

    collector.handle_datagram(buffer, static_cast<size_t>(received), ip_str);
    if (collector.stats().dropped > 0)
    {
      LOG("LSDP packet limit reached, ending pass early");
      break;
    }
  }

  auto stats = collector.stats();
  std::vector<Device> devices = collector.devices();
  LOG("LSDP discovery finished: " << devices.size() << " devices, " << stats.accepted
                                  << " packets accepted, " << stats.rejected << " rejected");
  return devices;
}

} // namespace bluos
