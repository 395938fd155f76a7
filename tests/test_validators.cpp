#include "bluos/device.h"
#include "bluos/errors.h"
#include "bluos/validators.h"

#include <gtest/gtest.h>

using namespace bluos;

TEST(ValidateIp, AcceptsUnicastIpv4)
{
  EXPECT_TRUE(validate_ip("192.168.1.20"));
  EXPECT_TRUE(validate_ip("10.0.0.1"));
  EXPECT_TRUE(validate_ip("8.8.8.8"));
}

TEST(ValidateIp, RejectsReservedRanges)
{
  EXPECT_FALSE(validate_ip("0.0.0.0"));
  EXPECT_FALSE(validate_ip("127.0.0.1"));
  EXPECT_FALSE(validate_ip("224.0.0.251"));
  EXPECT_FALSE(validate_ip("255.255.255.255"));
  EXPECT_FALSE(validate_ip("169.254.10.10"));
  EXPECT_FALSE(validate_ip("240.1.1.1"));
}

TEST(ValidateIp, RejectsMalformedText)
{
  EXPECT_FALSE(validate_ip(""));
  EXPECT_FALSE(validate_ip("192.168.1"));
  EXPECT_FALSE(validate_ip("192.168.1.256"));
  EXPECT_FALSE(validate_ip("192.168.1.1; rm -rf /"));
  EXPECT_FALSE(validate_ip("::1"));
  EXPECT_FALSE(validate_ip(std::string("192.168.1.1\0", 12)));
  EXPECT_FALSE(validate_ip("192.168.1.1\n"));
}

TEST(SanitizeIp, TrimsSurroundingWhitespace)
{
  ASSERT_TRUE(sanitize_ip("  192.168.1.5 ").has_value());
  EXPECT_EQ("192.168.1.5", *sanitize_ip("  192.168.1.5 "));
  EXPECT_FALSE(sanitize_ip("127.0.0.1").has_value());
}

TEST(ValidateHostname, AcceptsDnsNames)
{
  EXPECT_TRUE(validate_hostname("Living-Room.local"));
  EXPECT_TRUE(validate_hostname("node2"));
}

TEST(ValidateHostname, RejectsShellMetacharacters)
{
  EXPECT_FALSE(validate_hostname("host;reboot"));
  EXPECT_FALSE(validate_hostname("$(id).local"));
  EXPECT_FALSE(validate_hostname("a b"));
  EXPECT_FALSE(validate_hostname("-leading.local"));
  EXPECT_FALSE(validate_hostname(""));
  EXPECT_FALSE(validate_hostname(std::string(MAX_HOSTNAME_LENGTH + 1, 'a')));
}

TEST(ValidateServiceName, AllowsDnsSdTypes)
{
  EXPECT_TRUE(validate_service_name("_musc._tcp"));
  EXPECT_FALSE(validate_service_name("_musc._tcp; ls"));
  EXPECT_FALSE(validate_service_name(""));
}

TEST(LocalAddress, PrivateRangesOnly)
{
  EXPECT_TRUE(is_local_address("192.168.0.10"));
  EXPECT_TRUE(is_local_address("10.20.30.40"));
  EXPECT_TRUE(is_local_address("172.16.5.5"));
  EXPECT_TRUE(is_local_address("100.64.1.1"));
  EXPECT_FALSE(is_local_address("172.32.0.1"));
  EXPECT_FALSE(is_local_address("8.8.8.8"));
}

TEST(Volume, RequireThrowsOutsideRange)
{
  EXPECT_EQ(0, require_volume(0));
  EXPECT_EQ(100, require_volume(100));
  EXPECT_THROW(require_volume(-1), ValidationError);
  EXPECT_THROW(require_volume(101), ValidationError);
}

TEST(Volume, ClampStaysInRange)
{
  EXPECT_EQ(0, clamp_volume(-20));
  EXPECT_EQ(100, clamp_volume(250));
  EXPECT_EQ(42, clamp_volume(42));
}

TEST(Utf8, DetectsInvalidSequences)
{
  EXPECT_TRUE(is_valid_utf8("K\xC3\xBC" "che"));
  EXPECT_FALSE(is_valid_utf8("\xC3"));
  EXPECT_FALSE(is_valid_utf8("\xFF\xFE"));
}

TEST(Devices, NormalizeKeepsOneRecordPerAddress)
{
  Device hub;
  hub.address = "192.168.1.9";
  hub.device_class = DeviceClass::Hub;
  Device player;
  player.address = "192.168.1.9";
  player.name = "Kitchen";
  player.device_class = DeviceClass::Player;
  Device other;
  other.address = "192.168.1.3";
  other.device_class = DeviceClass::Player;

  std::vector<Device> result = normalize_devices({hub, other, player});
  ASSERT_EQ(2u, result.size());
  EXPECT_EQ("192.168.1.3", result[0].address);
  EXPECT_EQ("Kitchen", result[1].name);
  EXPECT_EQ(DeviceClass::Player, result[1].device_class);
}

TEST(Devices, MatchIsCaseInsensitiveSubstring)
{
  Device a;
  a.address = "192.168.1.2";
  a.name = "Living Room";
  Device b;
  b.address = "192.168.1.3";
  b.name = "Kitchen";

  EXPECT_EQ(1u, match_devices({a, b}, "living").size());
  EXPECT_EQ(2u, match_devices({a, b}, "").size());
  EXPECT_EQ(1u, match_devices({a, b}, "192.168.1.3").size());
  EXPECT_TRUE(match_devices({a, b}, "garage").empty());
}

TEST(Devices, MatchOneSelectsExactlyOneDevice)
{
  Device a;
  a.address = "192.168.1.2";
  a.name = "Kitchen";
  Device b;
  b.address = "192.168.1.3";
  b.name = "Kitchen Annex";
  Device c;
  c.address = "192.168.1.4";
  c.name = "Office";
  std::vector<Device> devices = {a, b, c};

  EXPECT_EQ("192.168.1.2", match_one_device(devices, "kitchen").address);
  EXPECT_EQ("192.168.1.3", match_one_device(devices, "annex").address);
  EXPECT_EQ("192.168.1.4", match_one_device(devices, "192.168.1.4").address);
  EXPECT_EQ("192.168.1.4", match_one_device(devices, " OFF ").address);

  EXPECT_THROW(match_one_device(devices, "kit"), ValidationError);
  EXPECT_THROW(match_one_device(devices, "garage"), ValidationError);
  EXPECT_THROW(match_one_device(devices, ""), ValidationError);
  EXPECT_THROW(match_one_device({}, "kitchen"), ValidationError);
}

TEST(Devices, DiscoveryMethodNames)
{
  DiscoveryMethod method = DiscoveryMethod::Mdns;
  EXPECT_TRUE(parse_discovery_method("both", method));
  EXPECT_EQ(DiscoveryMethod::Both, method);
  EXPECT_FALSE(parse_discovery_method("carrier-pigeon", method));
  EXPECT_STREQ("lsdp", discovery_method_name(DiscoveryMethod::Lsdp));
}
