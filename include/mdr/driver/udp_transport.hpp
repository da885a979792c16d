#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/core/socket.hpp"
#include "mdr/log.hpp"
#include "mdr/protocol/destination.hpp"
#include "mdr/types.hpp"

#include <netinet/ip.h>

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <utility>

namespace mdr {

enum class SendResult {
  Sent,
  /// 内核发送缓冲区已满，稍后重试
  Backpressure,
  /// 不可恢复的错误 (例如网络不可达)，该数据报被丢弃
  Failed,
};

/**
 * @brief 一个 Destination 的 UDP 端点，被该目的地上的所有通道共享
 *
 * 绑定本机临时端口，数据帧发往目的地址；接收端的状态消息回到同一 socket。
 */
class UdpTransport {
public:
  static constexpr std::int32_t RECEIVE_BUFFER_LENGTH = 64 * 1024;

  struct Datagram {
    std::int32_t length;
    sockaddr_in from;
  };

  /**
   * @throws std::system_error socket 创建或绑定失败
   */
  explicit UdpTransport(const UdpDestination &destination,
                        int send_buffer_bytes = 0)
      : destination_(destination), socket_(SOCK_DGRAM) {
    socket_.bind("0.0.0.0", 0);

    // 数据帧走低延迟 ToS
    constexpr int tos = IPTOS_LOWDELAY;
    if (socket_.set_opt(IPPROTO_IP, IP_TOS, tos) != 0) {
      MDR_LOG_WARN("transport", "IP_TOS rejected: {}", std::strerror(errno));
    }
    if (send_buffer_bytes > 0 &&
        socket_.set_opt(SOL_SOCKET, SO_SNDBUF, send_buffer_bytes) != 0) {
      MDR_LOG_WARN("transport", "SO_SNDBUF {} rejected: {}", send_buffer_bytes,
                   std::strerror(errno));
    }
    local_ = socket_.local_address();
    MDR_LOG_INFO("transport", "bound 0.0.0.0:{} for {}", ntohs(local_.sin_port),
                 destination_.canonical());
  }

  UdpTransport(const UdpTransport &) = delete;
  UdpTransport &operator=(const UdpTransport &) = delete;

  [[nodiscard]] SendResult send(std::span<const std::uint8_t> datagram) noexcept {
    const ssize_t sent = socket_.send_to(datagram, destination_.remote_data());
    if (sent == static_cast<ssize_t>(datagram.size())) {
      return SendResult::Sent;
    }
    if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS)) {
      return SendResult::Backpressure;
    }
    return SendResult::Failed;
  }

  [[nodiscard]] std::optional<Datagram> receive(std::span<std::uint8_t> buf) noexcept {
    Datagram d{};
    const ssize_t n = socket_.receive_from(buf, d.from);
    if (n < 0) {
      return std::nullopt;
    }
    d.length = static_cast<std::int32_t>(n);
    return d;
  }

  /**
   * @brief 读取当前所有已到达的数据报 (最多 limit 个)
   *
   * handler 签名: void(const AtomicBuffer &buffer, int32_t length,
   *                    const sockaddr_in &from)
   */
  template <typename F>
    requires std::invocable<F, const AtomicBuffer &, std::int32_t,
                            const sockaddr_in &>
  int poll_frames(F &&handler, int limit = 16) {
    int count = 0;
    while (count < limit) {
      auto d = receive(receive_buffer_);
      if (!d) {
        break;
      }
      ++count;
      std::invoke(handler, std::as_const(receive_view_), d->length, d->from);
    }
    return count;
  }

  [[nodiscard]] const UdpDestination &destination() const noexcept {
    return destination_;
  }
  [[nodiscard]] const sockaddr_in &local_address() const noexcept {
    return local_;
  }

private:
  UdpDestination destination_;
  net::Socket socket_;
  sockaddr_in local_{};
  alignas(8) std::array<std::uint8_t, RECEIVE_BUFFER_LENGTH> receive_buffer_{};
  AtomicBuffer receive_view_{receive_buffer_.data(),
                             static_cast<std::int32_t>(receive_buffer_.size())};
};

} // namespace mdr
