#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace mdr::net {

inline sockaddr_in make_addr(const std::string &ip, std::uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0)
    throw std::invalid_argument("Invalid IP: " + ip);
  return addr;
}

/**
 * @brief 非阻塞 IPv4 socket 的 RAII 封装
 *
 * Driver 只用到 UDP：send_to / receive_from 都不会阻塞，
 * 返回 -1 且 errno 为 EAGAIN 表示内核缓冲区满 / 无数据。
 */
class Socket {
  int fd_ = -1;

public:
  Socket() = default;

  explicit Socket(int type) {
    if ((fd_ = ::socket(AF_INET, type, 0)) < 0)
      throw_err("socket");

    set_non_blocking(true);
  }

  Socket(Socket &&o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  Socket &operator=(Socket &&o) noexcept {
    if (this != &o) {
      close();
      fd_ = std::exchange(o.fd_, -1);
    }
    return *this;
  }

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  ~Socket() { close(); }

  void close() noexcept {
    if (fd_ != -1)
      ::close(std::exchange(fd_, -1));
  }

  explicit operator bool() const noexcept { return fd_ != -1; }
  [[nodiscard]] int fd() const noexcept { return fd_; }

  // --------------------------------------------------------------------------
  // 配置接口
  // --------------------------------------------------------------------------

  // 返回 0 表示成功，-1 表示失败（可以通过 errno 查看原因）
  template <typename T> int set_opt(int level, int optname, const T &optval) {
    return ::setsockopt(fd_, level, optname, &optval, sizeof(optval));
  }

  void set_non_blocking(bool on = true) {
    int f = ::fcntl(fd_, F_GETFL);
    if (f < 0 ||
        ::fcntl(fd_, F_SETFL, on ? (f | O_NONBLOCK) : (f & ~O_NONBLOCK)) < 0)
      throw_err("fcntl");
  }

  // --------------------------------------------------------------------------
  // 核心 IO
  // --------------------------------------------------------------------------

  void bind(const sockaddr_in &addr) {
    if (::bind(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) < 0)
      throw_err("bind");
  }

  void bind(const std::string &ip, std::uint16_t port) {
    bind(make_addr(ip, port));
  }

  [[nodiscard]] sockaddr_in local_address() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0)
      throw_err("getsockname");
    return addr;
  }

  ssize_t send_to(std::span<const std::uint8_t> buf,
                  const sockaddr_in &addr) const noexcept {
    return ::sendto(fd_, buf.data(), buf.size(), MSG_NOSIGNAL,
                    reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
  }

  ssize_t receive_from(std::span<std::uint8_t> buf,
                       sockaddr_in &from) const noexcept {
    socklen_t len = sizeof(from);
    return ::recvfrom(fd_, buf.data(), buf.size(), 0,
                      reinterpret_cast<sockaddr *>(&from), &len);
  }

private:
  static void throw_err(const char *msg) {
    throw std::system_error(errno, std::system_category(), msg);
  }
};

} // namespace mdr::net
