#include "mdr/core/socket.hpp"
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstring>
#include <thread>

using namespace mdr::net;

class UdpSocketTest : public ::testing::Test {
protected:
  static constexpr const char *TEST_IP = "127.0.0.1";
};

TEST_F(UdpSocketTest, Creation) {
  Socket sock(SOCK_DGRAM);

  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
}

TEST_F(UdpSocketTest, EphemeralBind) {
  Socket sock(SOCK_DGRAM);
  EXPECT_NO_THROW({ sock.bind(TEST_IP, 0); });

  auto addr = sock.local_address();
  EXPECT_EQ(addr.sin_family, AF_INET);
  EXPECT_NE(ntohs(addr.sin_port), 0);
}

TEST_F(UdpSocketTest, BindConflictThrows) {
  Socket a(SOCK_DGRAM);
  a.bind(TEST_IP, 0);
  const auto port = ntohs(a.local_address().sin_port);

  Socket b(SOCK_DGRAM);
  EXPECT_THROW(b.bind(TEST_IP, port), std::system_error);
}

TEST_F(UdpSocketTest, InvalidAddress) {
  EXPECT_THROW((void)make_addr("not-an-ip", 1), std::invalid_argument);
}

TEST_F(UdpSocketTest, SetSockOpt) {
  Socket sock(SOCK_DGRAM);

  int size = 256 * 1024;
  EXPECT_EQ(sock.set_opt(SOL_SOCKET, SO_SNDBUF, size), 0);
}

TEST_F(UdpSocketTest, NonBlockingReceive) {
  Socket sock(SOCK_DGRAM);
  sock.bind(TEST_IP, 0);

  std::array<std::uint8_t, 64> buf{};
  sockaddr_in from{};
  EXPECT_EQ(sock.receive_from(buf, from), -1);
  EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
}

TEST_F(UdpSocketTest, SendAndReceive) {
  Socket receiver(SOCK_DGRAM);
  Socket sender(SOCK_DGRAM);
  receiver.bind(TEST_IP, 0);
  sender.bind(TEST_IP, 0);

  const char msg[] = "Hello UDP";
  std::span<const std::uint8_t> payload(
      reinterpret_cast<const std::uint8_t *>(msg), sizeof(msg));
  ASSERT_EQ(sender.send_to(payload, receiver.local_address()),
            static_cast<ssize_t>(sizeof(msg)));

  std::array<std::uint8_t, 64> buf{};
  sockaddr_in from{};
  ssize_t n = -1;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while ((n = receiver.receive_from(buf, from)) < 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::microseconds(100));
  }

  ASSERT_EQ(n, static_cast<ssize_t>(sizeof(msg)));
  EXPECT_EQ(std::memcmp(buf.data(), msg, sizeof(msg)), 0);
  EXPECT_EQ(from.sin_port, sender.local_address().sin_port);
}

TEST_F(UdpSocketTest, MoveSemantics) {
  Socket a(SOCK_DGRAM);
  const int fd = a.fd();

  Socket b = std::move(a);
  EXPECT_FALSE(a);
  EXPECT_EQ(b.fd(), fd);

  b.close();
  EXPECT_FALSE(b);
}
