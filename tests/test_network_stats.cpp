#include "bluos/errors.h"
#include "bluos/network_stats.h"

#include "fakes.h"

#include <gtest/gtest.h>

#include <fstream>

using namespace bluos;
using namespace bluos::test;

static const char *const CLIENTS = R"({
  "meta": {"rc": "ok"},
  "data": [
    {"ip": "192.168.1.20", "mac": "00:11:22:AA:BB:CC", "is_wired": true,
     "last_uplink_name": "Office Switch", "sw_port": 7,
     "wired-tx_bytes": 1000, "wired-rx_bytes": 200, "wired-tx_bytes-r": 50, "wired-rx_bytes-r": 5,
     "uptime": 3600},
    {"ip": "192.168.1.21", "mac": "00:11:22:dd:ee:ff", "is_wired": false,
     "ap_name": "Hallway AP", "essid": "home",
     "tx_bytes": 4000, "rx_bytes": 300, "tx_bytes-r": 10, "rx_bytes-r": 1},
    {"ip": "192.168.1.22", "type": "WIRED", "last_uplink_remote_port": 3},
    {"ip": "192.168.1.99", "mac": "ff:ff:ff:ff:ff:ff"},
    {"ip": "127.0.0.1"},
    "not an object"
  ]
})";

TEST(ParseUnifiClients, MapsWiredAndWirelessClients)
{
  std::map<std::string, NetworkClient> clients =
      parse_unifi_clients(CLIENTS, {"192.168.1.20", "192.168.1.21", "192.168.1.22", "192.168.1.23"});
  ASSERT_EQ(3u, clients.size());

  const NetworkClient &wired = clients.at("192.168.1.20");
  EXPECT_TRUE(wired.wired);
  EXPECT_EQ("00:11:22:aa:bb:cc", wired.mac);
  EXPECT_EQ("Office Switch", wired.uplink);
  EXPECT_EQ("7", wired.port_info);
  EXPECT_EQ(1000u, wired.down_total);
  EXPECT_EQ(200u, wired.up_total);
  EXPECT_EQ(50u, wired.down_rate);
  EXPECT_EQ(5u, wired.up_rate);
  EXPECT_EQ(3600u, wired.uptime);

  const NetworkClient &wifi = clients.at("192.168.1.21");
  EXPECT_FALSE(wifi.wired);
  EXPECT_EQ("Hallway AP", wifi.uplink);
  EXPECT_EQ("WiFi: home", wifi.port_info);
  EXPECT_EQ(4000u, wifi.down_total);

  const NetworkClient &typed = clients.at("192.168.1.22");
  EXPECT_TRUE(typed.wired);
  EXPECT_EQ("Unknown Switch", typed.uplink);
  EXPECT_EQ("3", typed.port_info);
  EXPECT_EQ(0u, typed.down_total);
}

TEST(ParseUnifiClients, RejectsUnexpectedShapes)
{
  EXPECT_THROW(parse_unifi_clients("{ nope", {"192.168.1.20"}), ProtocolError);
  EXPECT_THROW(parse_unifi_clients("[]", {"192.168.1.20"}), ProtocolError);
  EXPECT_THROW(parse_unifi_clients("{\"data\": {}}", {"192.168.1.20"}), ProtocolError);
  EXPECT_TRUE(parse_unifi_clients("{\"meta\": {}}", {"192.168.1.20"}).empty());
}

class UnifiStatsTest : public ::testing::Test
{
protected:
  UnifiStatsTest()
  {
    settings.enabled = true;
    settings.controller = "unifi.local";
    secrets.secrets[UNIFI_API_KEY_SECRET] = "key-from-store";
  }

  NetworkStats fetch(const std::vector<std::string> &addresses = {"192.168.1.20", "192.168.1.21"})
  {
    UnifiStatsProvider provider(transport, secrets, settings);
    return provider.fetch(addresses);
  }

  FakeTransport transport;
  FakeSecretStore secrets;
  UnifiSettings settings;
};

TEST_F(UnifiStatsTest, SkippedWhenDisabledOrNoDevices)
{
  EXPECT_EQ(NetworkStatsStatus::Skipped, fetch({}).status);
  settings.enabled = false;
  EXPECT_EQ(NetworkStatsStatus::Skipped, fetch().status);
  EXPECT_EQ("SKIPPED", fetch().summary());
  EXPECT_EQ(0u, transport.count());
}

TEST_F(UnifiStatsTest, MissingConfiguration)
{
  secrets.secrets.clear();
  EXPECT_EQ(NetworkStatsStatus::MissingConfig, fetch().status);

  settings.api_key = "key-from-settings";
  settings.controller.clear();
  EXPECT_EQ(NetworkStatsStatus::MissingConfig, fetch().status);

  settings.controller = "unifi.local:notaport";
  EXPECT_EQ(NetworkStatsStatus::MissingConfig, fetch().status);
  EXPECT_EQ(0u, transport.count());
}

TEST_F(UnifiStatsTest, SendsAuthenticatedHttpsRequest)
{
  settings.controller = "192.168.1.1:8443";
  settings.site = "home";
  transport.route("/proxy/network/api/s/home/stat/sta", CLIENTS);

  NetworkStats stats = fetch();
  EXPECT_EQ(NetworkStatsStatus::Success, stats.status);
  EXPECT_EQ("SUCCESS:2", stats.summary());

  ASSERT_EQ(1u, transport.count());
  HttpRequest sent = transport.requests()[0];
  EXPECT_TRUE(sent.https);
  EXPECT_EQ("192.168.1.1", sent.host);
  EXPECT_EQ(8443, sent.port);
  EXPECT_EQ("key-from-store", sent.headers.at("X-API-KEY"));
  EXPECT_EQ("application/json", sent.headers.at("Accept"));
  EXPECT_EQ(UNIFI_TIMEOUT, sent.timeout);
}

TEST_F(UnifiStatsTest, FallsBackToConfiguredKey)
{
  secrets.secrets.clear();
  settings.api_key = "key-from-settings";
  transport.route("/proxy/network/api/s/default/stat/sta", CLIENTS);

  EXPECT_EQ(NetworkStatsStatus::Success, fetch().status);
  EXPECT_EQ("key-from-settings", transport.requests()[0].headers.at("X-API-KEY"));
  EXPECT_EQ(443, transport.requests()[0].port);
}

TEST_F(UnifiStatsTest, FetchErrors)
{
  transport.push_error(ErrorKind::ConnectionFailed);
  EXPECT_EQ(NetworkStatsStatus::FetchError, fetch().status);

  transport.push_response(401, "{}");
  EXPECT_EQ(NetworkStatsStatus::FetchError, fetch().status);
  EXPECT_EQ("ERROR_FETCH", network_stats_status_name(NetworkStatsStatus::FetchError));
}

TEST_F(UnifiStatsTest, ParseError)
{
  transport.push_response(200, "<html>login</html>");
  NetworkStats stats = fetch();
  EXPECT_EQ(NetworkStatsStatus::ParseError, stats.status);
  EXPECT_TRUE(stats.clients.empty());
}

class UnifiCacheTest : public UnifiStatsTest
{
protected:
  UnifiCacheTest()
  {
    settings.cache_path = dir.file("unifi.json");
    settings.cache_ttl = std::chrono::seconds(300);
    transport.route("/proxy/network/api/s/default/stat/sta", CLIENTS);
  }

  NetworkStats fetch_at(std::chrono::system_clock::time_point at,
                        const std::vector<std::string> &addresses = {"192.168.1.20", "192.168.1.21"})
  {
    UnifiStatsProvider provider(transport, secrets, settings, [at] { return at; });
    return provider.fetch(addresses);
  }

  TempDir dir;
  std::chrono::system_clock::time_point t0 = std::chrono::system_clock::time_point(std::chrono::hours(480000));
};

TEST_F(UnifiCacheTest, SecondFetchWithinTtlIsCached)
{
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0).status);

  NetworkStats cached = fetch_at(t0 + std::chrono::seconds(299));
  EXPECT_EQ(NetworkStatsStatus::Cached, cached.status);
  EXPECT_EQ("CACHED", cached.summary());
  EXPECT_EQ(1u, transport.count());

  ASSERT_EQ(2u, cached.clients.size());
  const NetworkClient &wired = cached.clients.at("192.168.1.20");
  EXPECT_TRUE(wired.wired);
  EXPECT_EQ("Office Switch", wired.uplink);
  EXPECT_EQ("7", wired.port_info);
  EXPECT_EQ(1000u, wired.down_total);
  EXPECT_EQ(3600u, wired.uptime);
  EXPECT_EQ("WiFi: home", cached.clients.at("192.168.1.21").port_info);
}

TEST_F(UnifiCacheTest, CachedAnswerIsFilteredToRequestedDevices)
{
  fetch_at(t0);
  NetworkStats cached = fetch_at(t0 + std::chrono::seconds(1), {"192.168.1.21"});
  EXPECT_EQ(NetworkStatsStatus::Cached, cached.status);
  ASSERT_EQ(1u, cached.clients.size());
  EXPECT_EQ(1u, cached.clients.count("192.168.1.21"));
}

TEST_F(UnifiCacheTest, ExpiredOrFutureEntryRefetches)
{
  fetch_at(t0);
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0 + std::chrono::seconds(300)).status);
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0 - std::chrono::seconds(10)).status);
  EXPECT_EQ(3u, transport.count());
}

TEST_F(UnifiCacheTest, CorruptCacheRefetches)
{
  {
    std::ofstream out(settings.cache_path);
    out << "{\"ts\": \"yesterday\"}";
  }
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0).status);
  EXPECT_EQ(1u, transport.count());
}

TEST_F(UnifiCacheTest, FailuresAreNotCached)
{
  transport.push_response(500, "");
  EXPECT_EQ(NetworkStatsStatus::FetchError, fetch_at(t0).status);
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0 + std::chrono::seconds(1)).status);
}

TEST_F(UnifiCacheTest, ZeroTtlDisablesCache)
{
  settings.cache_ttl = std::chrono::seconds(0);
  fetch_at(t0);
  EXPECT_EQ(NetworkStatsStatus::Success, fetch_at(t0 + std::chrono::seconds(1)).status);
  EXPECT_EQ(2u, transport.count());
}

TEST_F(UnifiCacheTest, MissingConfigIsReportedBeforeCache)
{
  fetch_at(t0);
  settings.controller.clear();
  EXPECT_EQ(NetworkStatsStatus::MissingConfig, fetch_at(t0 + std::chrono::seconds(1)).status);
}
