#include "mdr/command/buffer_notification.hpp"
#include "mdr/command/channel_message.hpp"
#include "mdr/command/control_protocol.hpp"
#include "mdr/command/error_response.hpp"
#include "mdr/config.hpp"
#include "mdr/core/shared_memory.hpp"
#include "mdr/driver/conductor_buffers.hpp"
#include "mdr/log.hpp"
#include "mdr/log_buffer/publication.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include "mdr/platform.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

// 连接到运行中的 media_driver，申请一个通道并发布消息
//
//   ./publisher [udp://host:port] [count]
//
// 对端可以用 `nc -ul <port>` 观察收到的数据帧 (以及空闲时的心跳)。

using namespace mdr;

namespace {

constexpr std::uint64_t SESSION_ID = 0x5eed;
constexpr std::uint64_t CHANNEL_ID = 1;

struct Notification {
  std::string location;
};

// 等待 Conductor 对 ADD_CHANNEL 的应答
std::optional<Notification> await_notification(ConductorBuffers &buffers,
                                               std::chrono::seconds timeout) {
  std::optional<Notification> result;
  bool answered = false;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (!answered && std::chrono::steady_clock::now() < deadline) {
    const int n = buffers.to_client().read(
        [&](std::int32_t type_id, const AtomicBuffer &buffer, std::int32_t index,
            std::int32_t) {
          if (type_id == control_protocol::NEW_SEND_BUFFER_NOTIFICATION) {
            NewBufferMessageFlyweight msg(buffer, index);
            if (msg.session_id() == SESSION_ID && msg.channel_id() == CHANNEL_ID) {
              result = Notification{std::string(msg.location())};
              answered = true;
            }
          } else if (type_id == control_protocol::ERROR_RESPONSE) {
            ErrorFlyweight err(buffer, index);
            MDR_LOG_ERROR("publisher", "driver rejected channel: {} ({})",
                          err.error_message(),
                          error_code_name(err.error_code()));
            answered = true;
          }
        });
    if (n == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  return result;
}

} // namespace

int main(int argc, char **argv) {
  const std::string destination = argc > 1 ? argv[1] : "udp://localhost:40123";
  const int count = argc > 2 ? std::atoi(argv[2]) : 1000;

  try {
    const DriverConfig cfg = DriverConfig::from_env();
    ConductorBuffers buffers(cfg.admin_dir());

    alignas(8) std::array<std::uint8_t, 1024> scratch{};
    AtomicBuffer scratch_buffer(scratch.data(), static_cast<std::int32_t>(scratch.size()));

    ChannelMessageFlyweight request(scratch_buffer, 0);
    request.channel_id(CHANNEL_ID).session_id(SESSION_ID).destination(destination);
    while (!buffers.to_driver().write(control_protocol::ADD_CHANNEL, scratch_buffer, 0,
                                      request.length())) {
      cpu_relax();
    }
    MDR_LOG_INFO("publisher", "ADD_CHANNEL {} sent", destination);

    auto notification = await_notification(buffers, std::chrono::seconds(5));
    if (!notification) {
      MDR_LOG_ERROR("publisher", "no usable answer from driver at {}", cfg.dir);
      return 1;
    }
    MDR_LOG_INFO("publisher", "term log at {}", notification->location);

    MappedRegion region = MappedRegion::open(notification->location);
    Publication publication{TermLog(region.buffer())};

    alignas(8) std::array<std::uint8_t, 64> payload{};
    AtomicBuffer payload_buffer(payload.data(), static_cast<std::int32_t>(payload.size()));

    int backpressured = 0;
    for (int i = 0; i < count; ++i) {
      payload_buffer.put_int64(0, i);
      payload_buffer.put_int64(8, system_nano_time());
      while (!publication.offer(payload_buffer, 0, payload_buffer.capacity())) {
        ++backpressured;
        std::this_thread::yield();
      }
    }
    MDR_LOG_INFO("publisher", "published {} messages, term_id={} backpressured={}",
                 count, publication.term_id(), backpressured);

    // 给 Sender 时间把最后的帧发出去，再释放通道
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    while (!buffers.to_driver().write(control_protocol::REMOVE_CHANNEL, scratch_buffer,
                                      0, request.length())) {
      cpu_relax();
    }
    MDR_LOG_INFO("publisher", "REMOVE_CHANNEL {} sent", destination);
  } catch (const std::exception &e) {
    std::cerr << "publisher: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
