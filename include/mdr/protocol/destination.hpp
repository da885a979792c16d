#pragma once

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mdr {

class InvalidDestination : public std::invalid_argument {
public:
  explicit InvalidDestination(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief UDP 目的地址 `udp://<host>:<port>`
 *
 * 点分十进制的 host 直接转换，主机名通过 getaddrinfo 解析为 IPv4 地址。
 * 相等性与哈希只看解析后的 (协议, 地址, 端口)，因此 `udp://localhost:40123`
 * 与 `udp://127.0.0.1:40123` 是同一个目的地。
 */
class UdpDestination {
public:
  static constexpr std::string_view SCHEME = "udp://";

  /**
   * @throws InvalidDestination URI 格式错误或 host 无法解析
   */
  static UdpDestination parse(std::string_view uri) {
    if (!uri.starts_with(SCHEME)) {
      throw InvalidDestination("unsupported scheme: " + std::string(uri));
    }

    std::string_view authority = uri.substr(SCHEME.size());
    auto colon = authority.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
      throw InvalidDestination("missing host or port: " + std::string(uri));
    }

    std::string host(authority.substr(0, colon));
    std::string_view port_str = authority.substr(colon + 1);

    std::uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(),
                                     port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
        port == 0 || port > 65535) {
      throw InvalidDestination("invalid port: " + std::string(uri));
    }

    sockaddr_in addr = resolve(host);
    addr.sin_port = htons(static_cast<std::uint16_t>(port));

    return UdpDestination(std::string(uri), addr);
  }

  static std::optional<UdpDestination> try_parse(std::string_view uri) {
    try {
      return parse(uri);
    } catch (const InvalidDestination &) {
      return std::nullopt;
    }
  }

  /// 原始 URI (用于回显给客户端)
  [[nodiscard]] const std::string &uri() const noexcept { return uri_; }
  [[nodiscard]] const sockaddr_in &remote_data() const noexcept { return addr_; }

  [[nodiscard]] std::uint32_t address() const noexcept {
    return ntohl(addr_.sin_addr.s_addr);
  }
  [[nodiscard]] std::uint16_t port() const noexcept {
    return ntohs(addr_.sin_port);
  }

  /// 解析后的主机地址，例如 "127.0.0.1"
  [[nodiscard]] std::string host() const {
    char buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof(buf));
    return buf;
  }

  /// 规范形式，例如 "udp://127.0.0.1:40123"
  [[nodiscard]] std::string canonical() const {
    return std::string(SCHEME) + host() + ":" + std::to_string(port());
  }

  bool operator==(const UdpDestination &o) const noexcept {
    return address() == o.address() && port() == o.port();
  }

  [[nodiscard]] std::size_t hash() const noexcept {
    return std::hash<std::uint64_t>{}(
        (static_cast<std::uint64_t>(address()) << 16) | port());
  }

private:
  // 点分十进制地址直接转换；主机名才走 getaddrinfo (可能阻塞在 DNS 上)
  static sockaddr_in resolve(const std::string &host) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
      return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res = nullptr;
    if (int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
        rc != 0 || res == nullptr) {
      throw InvalidDestination("cannot resolve host '" + host +
                               "': " + ::gai_strerror(rc));
    }
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    ::freeaddrinfo(res);
    return addr;
  }

  UdpDestination(std::string uri, const sockaddr_in &addr)
      : uri_(std::move(uri)), addr_(addr) {}

  std::string uri_;
  sockaddr_in addr_{};
};

} // namespace mdr

template <> struct std::hash<mdr::UdpDestination> {
  std::size_t operator()(const mdr::UdpDestination &d) const noexcept {
    return d.hash();
  }
};
