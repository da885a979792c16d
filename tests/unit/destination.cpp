#include "mdr/protocol/destination.hpp"
#include <gtest/gtest.h>

#include <unordered_map>

using namespace mdr;

TEST(UdpDestinationTest, ParseNumericHost) {
  auto d = UdpDestination::parse("udp://127.0.0.1:40123");

  EXPECT_EQ(d.uri(), "udp://127.0.0.1:40123");
  EXPECT_EQ(d.host(), "127.0.0.1");
  EXPECT_EQ(d.port(), 40123);
  EXPECT_EQ(d.address(), 0x7F000001u);
  EXPECT_EQ(d.remote_data().sin_family, AF_INET);
  EXPECT_EQ(ntohs(d.remote_data().sin_port), 40123);
}

// 点分十进制地址逐字节转换为网络序
TEST(UdpDestinationTest, ParseDottedQuads) {
  EXPECT_EQ(UdpDestination::parse("udp://10.1.2.3:1").address(), 0x0A010203u);
  EXPECT_EQ(UdpDestination::parse("udp://0.0.0.0:1").address(), 0u);
  EXPECT_EQ(UdpDestination::parse("udp://255.255.255.255:65535").address(),
            0xFFFFFFFFu);
  EXPECT_EQ(UdpDestination::parse("udp://192.168.0.7:5000").canonical(),
            "udp://192.168.0.7:5000");
}

TEST(UdpDestinationTest, ResolvesLocalhost) {
  auto d = UdpDestination::parse("udp://localhost:9000");

  EXPECT_EQ(d.uri(), "udp://localhost:9000");
  EXPECT_EQ(d.canonical(), "udp://127.0.0.1:9000");
}

// 相等性按解析后的地址比较，原始字符串不同也视为同一目的地
TEST(UdpDestinationTest, EqualityUsesResolvedAddress) {
  auto a = UdpDestination::parse("udp://localhost:40123");
  auto b = UdpDestination::parse("udp://127.0.0.1:40123");
  auto c = UdpDestination::parse("udp://127.0.0.1:40124");

  EXPECT_EQ(a, b);
  EXPECT_EQ(std::hash<UdpDestination>{}(a), std::hash<UdpDestination>{}(b));
  EXPECT_FALSE(a == c);

  std::unordered_map<UdpDestination, int> map;
  map.emplace(a, 1);
  EXPECT_EQ(map.count(b), 1u);
  EXPECT_EQ(map.count(c), 0u);
}

TEST(UdpDestinationTest, RejectsMalformedUris) {
  const char *bad[] = {
      "",
      "tcp://localhost:40123",
      "udp://",
      "udp://localhost",
      "udp://:40123",
      "udp://localhost:",
      "udp://localhost:0",
      "udp://localhost:65536",
      "udp://localhost:12ab",
      "udp://localhost:-1",
      "udp://no-such-host.invalid:40123",
  };

  for (const char *uri : bad) {
    EXPECT_THROW((void)UdpDestination::parse(uri), InvalidDestination) << uri;
    EXPECT_FALSE(UdpDestination::try_parse(uri).has_value()) << uri;
  }
}

TEST(UdpDestinationTest, InvalidDestinationIsInvalidArgument) {
  EXPECT_THROW((void)UdpDestination::parse("bogus"), std::invalid_argument);
}
