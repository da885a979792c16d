#pragma once

#include "mdr/command/buffer_notification.hpp"
#include "mdr/command/channel_message.hpp"
#include "mdr/command/control_protocol.hpp"
#include "mdr/command/error_response.hpp"
#include "mdr/config.hpp"
#include "mdr/core/atomic_buffer.hpp"
#include "mdr/core/ring_buffer.hpp"
#include "mdr/driver/buffer_management.hpp"
#include "mdr/driver/flow_control.hpp"
#include "mdr/driver/sender.hpp"
#include "mdr/driver/sender_channel.hpp"
#include "mdr/driver/udp_transport.hpp"
#include "mdr/log.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include "mdr/protocol/destination.hpp"
#include "mdr/protocol/header_flyweight.hpp"
#include "mdr/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace mdr {

/**
 * @brief 管理线程：处理客户端命令，维护 (Destination, Channel, Session) 注册表
 *
 * 每个三元组的状态只有 ABSENT / ACTIVE 两种，所有转换都在本线程内完成，
 * 注册表不与其它线程共享。通道的发送状态通过 SenderQueue 移交给 Sender。
 *
 * @section 应答
 * - ADD_CHANNEL 成功: NEW_SEND_BUFFER_NOTIFICATION
 * - 失败: ERROR_RESPONSE，总是附带出错请求的完整编码
 *
 * to-client 缓冲区满时应答被丢弃并记录错误日志，Conductor 从不重试。
 */
class Conductor {
public:
  static constexpr int COMMAND_LIMIT = 16;
  static constexpr int FRAME_LIMIT = 16;

  Conductor(const DriverConfig &cfg, ManyToOneRingBuffer &to_driver,
            ManyToOneRingBuffer &to_client, BufferManagement &buffer_management,
            SenderQueue &sender_queue)
      : to_driver_(to_driver), to_client_(to_client),
        buffer_management_(buffer_management), sender_queue_(sender_queue),
        mtu_(cfg.mtu), flow_control_supplier_(cfg.flow_control_supplier),
        scratch_(static_cast<std::size_t>(to_client.max_msg_length())),
        scratch_view_(scratch_.data(), static_cast<std::int32_t>(scratch_.size())) {
  }

  ~Conductor() { close(); }

  Conductor(const Conductor &) = delete;
  Conductor &operator=(const Conductor &) = delete;

  /// @return 本轮完成的工作量，0 表示空闲
  int process() {
    int work = flush_pending();

    work += to_driver_.read(
        [this](std::int32_t type_id, const AtomicBuffer &buffer,
               std::int32_t index, std::int32_t length) {
          on_command(type_id, buffer, index, length);
        },
        COMMAND_LIMIT);

    work += poll_transports();
    return work;
  }

  /// 目的地当前的 UDP 端点，没有活动通道时返回 nullptr
  [[nodiscard]] UdpTransport *frame_handler(const UdpDestination &destination) const {
    auto it = destinations_.find(destination);
    return it == destinations_.end() ? nullptr : it->second.transport.get();
  }

  [[nodiscard]] std::size_t publication_count() const noexcept {
    std::size_t n = 0;
    for (const auto &[dest, entry] : destinations_) {
      n += entry.publications.size();
    }
    return n;
  }

  void close() noexcept {
    pending_.clear();
    destinations_.clear();
  }

private:
  struct PublicationKey {
    std::uint64_t session_id;
    std::uint64_t channel_id;
    bool operator==(const PublicationKey &) const = default;
  };

  struct PublicationKeyHash {
    std::size_t operator()(const PublicationKey &k) const noexcept {
      return std::hash<std::uint64_t>{}(k.session_id * 31 + k.channel_id);
    }
  };

  struct PublicationEntry {
    std::uint64_t registration_id;
    std::shared_ptr<MappedRegion> region;
  };

  struct DestinationEntry {
    std::shared_ptr<UdpTransport> transport;
    std::unordered_map<PublicationKey, PublicationEntry, PublicationKeyHash>
        publications;
  };

  // ===========================================================================
  // 命令分发
  // ===========================================================================

  void on_command(std::int32_t type_id, const AtomicBuffer &buffer,
                  std::int32_t index, std::int32_t length) {
    const AtomicBuffer record = buffer.view(index, length);

    try {
      switch (type_id) {
      case control_protocol::ADD_CHANNEL:
        on_add_channel(record);
        break;
      case control_protocol::REMOVE_CHANNEL:
        on_remove_channel(record);
        break;
      default:
        MDR_LOG_WARN("conductor", "dropped unknown command type {} ({} bytes)",
                     type_id, length);
        break;
      }
    } catch (const DecodeError &e) {
      MDR_LOG_WARN("conductor", "dropped malformed {}: {}",
                   control_protocol::event_name(type_id), e.what());
    }
  }

  ChannelMessageFlyweight decode(const AtomicBuffer &record) const {
    if (record.capacity() <
        ChannelMessageFlyweight::DESTINATION_OFFSET +
            static_cast<std::int32_t>(sizeof(std::int32_t))) {
      throw DecodeError("channel message too short: " +
                        std::to_string(record.capacity()));
    }
    return ChannelMessageFlyweight(record, 0);
  }

  void on_add_channel(const AtomicBuffer &record) {
    const ChannelMessageFlyweight msg = decode(record);
    const std::string_view uri = msg.destination();
    const PublicationKey key{msg.session_id(), msg.channel_id()};

    auto destination = UdpDestination::try_parse(uri);
    if (!destination) {
      send_error(ErrorCode::InvalidDestination,
                 "invalid destination: " + std::string(uri), record);
      return;
    }

    auto dest_it = destinations_.find(*destination);
    if (dest_it != destinations_.end() &&
        dest_it->second.publications.contains(key)) {
      send_error(ErrorCode::ChannelAlreadyExists,
                 "channel already exists: session=" + std::to_string(key.session_id) +
                     " channel=" + std::to_string(key.channel_id),
                 record);
      return;
    }

    std::shared_ptr<UdpTransport> transport;
    std::shared_ptr<MappedRegion> region;
    try {
      transport = dest_it != destinations_.end()
                      ? dest_it->second.transport
                      : std::make_shared<UdpTransport>(*destination);
      region = buffer_management_.add_publication(*destination, key.session_id,
                                                  key.channel_id);

      TermLog log(region->buffer());
      log.initialise(INITIAL_TERM_ID, mtu_, key.session_id, key.channel_id);
    } catch (const std::system_error &e) {
      if (region) {
        buffer_management_.remove_publication(*destination, key.session_id,
                                              key.channel_id);
      }
      send_error(ErrorCode::ResourceUnavailable, e.what(), record);
      return;
    }

    // 应答放不进 to-client 的单条消息上限时拒绝，注册表保持不变
    const std::int64_t notification_length =
        NewBufferMessageFlyweight::compute_length(uri.size(), region->path().size());
    if (notification_length > scratch_view_.capacity()) {
      buffer_management_.remove_publication(*destination, key.session_id,
                                            key.channel_id);
      send_error(ErrorCode::ResourceUnavailable,
                 "notification of " + std::to_string(notification_length) +
                     " bytes exceeds reply limit " +
                     std::to_string(scratch_view_.capacity()),
                 record);
      return;
    }

    const std::uint64_t registration_id = next_registration_id_++;
    auto channel = std::make_unique<SenderChannel>(
        *destination, key.session_id, key.channel_id, region, transport,
        flow_control_supplier_ ? flow_control_supplier_()
                               : make_default_flow_control());

    if (dest_it == destinations_.end()) {
      dest_it = destinations_.emplace(*destination, DestinationEntry{transport, {}})
                    .first;
    }
    dest_it->second.publications.emplace(key,
                                         PublicationEntry{registration_id, region});

    enqueue(SenderCommand{.kind = SenderCommand::Kind::AddChannel,
                          .registration_id = registration_id,
                          .channel = std::move(channel)});

    MDR_LOG_INFO("conductor", "added session={} channel={} dest={} log={}",
                 key.session_id, key.channel_id, uri, region->path());

    send_notification(key, uri, region->path());
  }

  void on_remove_channel(const AtomicBuffer &record) {
    const ChannelMessageFlyweight msg = decode(record);
    const std::string_view uri = msg.destination();
    const PublicationKey key{msg.session_id(), msg.channel_id()};

    auto destination = UdpDestination::try_parse(uri);
    if (!destination) {
      send_error(ErrorCode::InvalidDestination,
                 "invalid destination: " + std::string(uri), record);
      return;
    }

    auto dest_it = destinations_.find(*destination);
    if (dest_it == destinations_.end()) {
      send_error(ErrorCode::InvalidDestination,
                 "destination unknown: " + std::string(uri), record);
      return;
    }

    auto &publications = dest_it->second.publications;
    auto pub_it = publications.find(key);
    if (pub_it == publications.end()) {
      send_error(ErrorCode::ChannelUnknown,
                 "channel unknown: session=" + std::to_string(key.session_id) +
                     " channel=" + std::to_string(key.channel_id),
                 record);
      return;
    }

    enqueue(SenderCommand{.kind = SenderCommand::Kind::RemoveChannel,
                          .registration_id = pub_it->second.registration_id});
    buffer_management_.remove_publication(*destination, key.session_id,
                                          key.channel_id);
    publications.erase(pub_it);

    MDR_LOG_INFO("conductor", "removed session={} channel={} dest={}",
                 key.session_id, key.channel_id, uri);

    if (publications.empty()) {
      destinations_.erase(dest_it);
      MDR_LOG_INFO("conductor", "released transport for {}",
                   destination->canonical());
    }
  }

  // ===========================================================================
  // 入站控制帧 (状态消息)
  // ===========================================================================

  int poll_transports() {
    int work = 0;
    for (auto &[destination, entry] : destinations_) {
      auto &publications = entry.publications;
      work += entry.transport->poll_frames(
          [this, &publications](const AtomicBuffer &buffer, std::int32_t length,
                                const sockaddr_in &) {
            if (length < StatusMessageFlyweight::HEADER_LENGTH) {
              return;
            }
            const StatusMessageFlyweight sm(buffer, 0);
            if (sm.header_type() != HeaderFlyweight::HDR_TYPE_SM ||
                sm.frame_length() < StatusMessageFlyweight::HEADER_LENGTH) {
              return;
            }

            auto it = publications.find(PublicationKey{sm.session_id(), sm.channel_id()});
            if (it == publications.end()) {
              return;
            }

            enqueue(SenderCommand{
                .kind = SenderCommand::Kind::StatusMessage,
                .registration_id = it->second.registration_id,
                .status = StatusUpdate{
                    .term_id = sm.term_id(),
                    .highest_contiguous_term_offset =
                        sm.highest_contiguous_term_offset(),
                    .receiver_window = sm.receiver_window()}});
          },
          FRAME_LIMIT);
    }
    return work;
  }

  // ===========================================================================
  // Sender 交接
  // ===========================================================================

  /// 队列满时暂存，保持命令顺序
  void enqueue(SenderCommand cmd) {
    if (pending_.empty() && sender_queue_.try_push(std::move(cmd))) {
      return;
    }
    pending_.push_back(std::move(cmd));
  }

  int flush_pending() {
    int work = 0;
    while (!pending_.empty() && sender_queue_.try_push(std::move(pending_.front()))) {
      pending_.pop_front();
      ++work;
    }
    return work;
  }

  // ===========================================================================
  // 应答
  // ===========================================================================

  void send_notification(const PublicationKey &key, std::string_view uri,
                         const std::string &location) {
    NewBufferMessageFlyweight notification(scratch_view_, 0);
    notification.session_id(key.session_id);
    notification.channel_id(key.channel_id);
    notification.destination(uri);
    notification.location(location);

    reply(control_protocol::NEW_SEND_BUFFER_NOTIFICATION, notification.length());
  }

  void send_error(ErrorCode code, std::string message, const AtomicBuffer &offending) {
    MDR_LOG_WARN("conductor", "{}: {}", error_code_name(code), message);

    // 错误字符串过长时截断，保证出错请求完整附带；
    // 出错请求本身放不下时只回错误码和错误字符串
    const std::int32_t capacity = scratch_view_.capacity();
    std::int32_t echo_length = offending.capacity();
    std::int32_t room = capacity - ErrorFlyweight::HEADER_LENGTH - echo_length - 8;
    if (room < 0) {
      MDR_LOG_WARN("conductor", "offending request too large to echo ({} bytes)",
                   echo_length);
      echo_length = 0;
      room = capacity - ErrorFlyweight::HEADER_LENGTH;
    }
    if (static_cast<std::int32_t>(message.size()) > room) {
      message.resize(static_cast<std::size_t>(room));
    }

    ErrorFlyweight error(scratch_view_, 0);
    error.error_code(code);
    error.error_message(message);
    error.offending_header(offending, 0, echo_length);

    reply(control_protocol::ERROR_RESPONSE, error.length());
  }

  void reply(std::int32_t type_id, std::int32_t length) {
    if (!to_client_.write(type_id, scratch_view_, 0, length)) {
      MDR_LOG_ERROR("conductor", "to-client buffer full, dropped {}",
                    control_protocol::event_name(type_id));
    }
  }

  static constexpr std::int32_t INITIAL_TERM_ID = 0;

  ManyToOneRingBuffer &to_driver_;
  ManyToOneRingBuffer &to_client_;
  BufferManagement &buffer_management_;
  SenderQueue &sender_queue_;
  std::int32_t mtu_;
  std::function<std::unique_ptr<FlowControlStrategy>()> flow_control_supplier_;

  std::unordered_map<UdpDestination, DestinationEntry> destinations_;
  std::deque<SenderCommand> pending_;
  std::uint64_t next_registration_id_ = 1;

  std::vector<std::uint8_t> scratch_;
  AtomicBuffer scratch_view_;
};

} // namespace mdr
