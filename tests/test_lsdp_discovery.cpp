#include "bluos/lsdp_discovery.h"

#include "socket_compat.h"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace bluos;

namespace
{

std::vector<uint8_t> announce(const std::string &node, const std::string &address, const std::string &name,
                              uint16_t class_id = LSDP_CLASS_PLAYER)
{
  LsdpPacket packet;
  LsdpAnnounce a;
  a.node_id = node;
  a.address = address;
  LsdpRecord r;
  r.class_id = class_id;
  r.txt["name"] = name;
  a.records.push_back(r);
  packet.announces.push_back(a);
  return packet.serialize();
}

std::vector<uint8_t> remove_node(const std::string &node)
{
  LsdpPacket packet;
  LsdpDelete d;
  d.node_id = node;
  d.class_ids.push_back(LSDP_CLASS_PLAYER);
  packet.deletes.push_back(d);
  return packet.serialize();
}

bool feed(LsdpCollector &collector, const std::vector<uint8_t> &bytes, const std::string &source = "192.168.1.1")
{
  return collector.handle_datagram(bytes.data(), bytes.size(), source);
}

// A UDP port nothing is bound to right now.
uint16_t free_udp_port()
{
  ScopedSocket sock(socket(AF_INET, SOCK_DGRAM, 0));
  struct sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len = sizeof(addr);
  if (!sock.valid() || bind(sock.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0 ||
      getsockname(sock.get(), reinterpret_cast<struct sockaddr *>(&addr), &len) != 0)
    return 0;
  return ntohs(addr.sin_port);
}

// Sends each datagram to 127.0.0.1:port every 100ms until stopped.
class LoopbackAnnouncer
{
public:
  LoopbackAnnouncer(uint16_t port, std::vector<std::vector<uint8_t>> datagrams)
      : port_(port), datagrams_(std::move(datagrams)), thread_([this] { run(); })
  {
  }

  ~LoopbackAnnouncer()
  {
    stop_ = true;
    thread_.join();
  }

  int sent() const { return sent_; }

private:
  void run()
  {
    ScopedSocket sock(socket(AF_INET, SOCK_DGRAM, 0));
    struct sockaddr_in target = {};
    target.sin_family = AF_INET;
    target.sin_port = htons(port_);
    target.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    while (!stop_)
    {
      for (const auto &datagram : datagrams_)
      {
        if (sendto(sock.get(), datagram.data(), datagram.size(), 0, reinterpret_cast<struct sockaddr *>(&target),
                   sizeof(target)) == static_cast<ssize_t>(datagram.size()))
          sent_++;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  uint16_t port_;
  std::vector<std::vector<uint8_t>> datagrams_;
  std::atomic<bool> stop_{false};
  std::atomic<int> sent_{0};
  std::thread thread_;
};

} // namespace

TEST(LsdpCollector, CollectsAnnouncedNodes)
{
  LsdpCollector collector;
  EXPECT_TRUE(feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen")));
  EXPECT_TRUE(feed(collector, announce("00:11:22:33:44:66", "192.168.1.21", "Office")));

  std::vector<Device> devices = collector.devices();
  ASSERT_EQ(2u, devices.size());
  EXPECT_EQ("192.168.1.20", devices[0].address);
  EXPECT_EQ("Kitchen", devices[0].name);
  EXPECT_EQ("Office", devices[1].name);
}

TEST(LsdpCollector, ReannounceRefreshesNode)
{
  LsdpCollector collector;
  feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen"));
  feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen Left"));

  ASSERT_EQ(1u, collector.count());
  EXPECT_EQ("Kitchen Left", collector.devices()[0].name);
}

TEST(LsdpCollector, DeleteRemovesNode)
{
  LsdpCollector collector;
  feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen"));
  feed(collector, remove_node("00:11:22:33:44:55"));
  EXPECT_EQ(0u, collector.count());
}

TEST(LsdpCollector, RejectsInvalidAnnouncedAddress)
{
  LsdpCollector collector;
  EXPECT_TRUE(feed(collector, announce("00:11:22:33:44:55", "127.0.0.1", "Loop")));
  EXPECT_EQ(0u, collector.count());
}

TEST(LsdpCollector, RejectsInvalidUtf8Name)
{
  LsdpCollector collector;
  feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "\xC3"));
  EXPECT_EQ(0u, collector.count());
}

TEST(LsdpCollector, CountsMalformedDatagrams)
{
  LsdpCollector collector;
  std::vector<uint8_t> junk = {'n', 'o', 'p', 'e', '!', '!', '!'};
  EXPECT_FALSE(feed(collector, junk));

  LsdpCollector::Stats stats = collector.stats();
  EXPECT_EQ(0u, stats.accepted);
  EXPECT_EQ(1u, stats.rejected);
}

TEST(LsdpCollector, DropsPacketsPastCeiling)
{
  LsdpCollector collector;
  std::vector<uint8_t> query = build_query_packet({LSDP_CLASS_PLAYER});
  for (size_t i = 0; i < LSDP_MAX_PACKETS; i++)
    feed(collector, query);

  EXPECT_FALSE(feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Late")));
  EXPECT_EQ(1u, collector.stats().dropped);
  EXPECT_EQ(0u, collector.count());
}

TEST(LsdpCollector, ClearResetsState)
{
  LsdpCollector collector;
  feed(collector, announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen"));
  collector.clear();
  EXPECT_EQ(0u, collector.count());
  EXPECT_EQ(0u, collector.stats().accepted);
}

TEST(LsdpDiscovery, QueryScheduleIsIncreasing)
{
  const std::vector<std::chrono::milliseconds> &schedule = LsdpDiscovery::query_schedule();
  ASSERT_FALSE(schedule.empty());
  EXPECT_EQ(0, schedule.front().count());
  for (size_t i = 1; i < schedule.size(); i++)
    EXPECT_GT(schedule[i], schedule[i - 1]);
}

TEST(LsdpDiscovery, CollectsAnnouncementsOverLoopback)
{
  uint16_t port = free_udp_port();
  ASSERT_NE(0, port);

  LsdpOptions options;
  options.port = port;
  options.broadcast_address = "127.0.0.1";
  LsdpDiscovery discovery(options);

  std::vector<uint8_t> garbage = {'L', 'S', 'D', 'P', 0xff, 0x00};
  LoopbackAnnouncer announcer(port, {announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen"), garbage,
                                     announce("00:11:22:33:44:66", "192.168.1.21", "Office", LSDP_CLASS_HUB)});

  auto start = std::chrono::steady_clock::now();
  std::vector<Device> devices = discovery.discover(std::chrono::milliseconds(800));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GT(announcer.sent(), 0);
  ASSERT_EQ(2u, devices.size());
  EXPECT_EQ("192.168.1.20", devices[0].address);
  EXPECT_EQ("Kitchen", devices[0].name);
  EXPECT_EQ(DeviceClass::Player, devices[0].device_class);
  EXPECT_EQ("Office", devices[1].name);
  EXPECT_EQ(DeviceClass::Hub, devices[1].device_class);
  EXPECT_GE(elapsed, std::chrono::milliseconds(750));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(LsdpDiscovery, DeleteOverLoopbackRemovesNode)
{
  uint16_t port = free_udp_port();
  ASSERT_NE(0, port);

  LsdpOptions options;
  options.port = port;
  options.broadcast_address = "127.0.0.1";
  LsdpDiscovery discovery(options);

  LoopbackAnnouncer announcer(port, {announce("00:11:22:33:44:55", "192.168.1.20", "Kitchen"),
                                     remove_node("00:11:22:33:44:55")});
  EXPECT_TRUE(discovery.discover(std::chrono::milliseconds(500)).empty());
}
