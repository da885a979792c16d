#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/core/shared_memory.hpp"
#include "mdr/core/timer_wheel.hpp"
#include "mdr/driver/flow_control.hpp"
#include "mdr/driver/udp_transport.hpp"
#include "mdr/log.hpp"
#include "mdr/log_buffer/log_scanner.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include "mdr/protocol/destination.hpp"
#include "mdr/protocol/header_flyweight.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <utility>

namespace mdr {

/**
 * @brief 一个会话的发送状态 (只在 Sender 线程上使用)
 *
 * 从 Term Log 中按顺序取出已提交的帧原样发往目的地址。
 *
 * @section 位置
 * position(term_id, offset) = (term_id - initial_term_id) * term_capacity + offset
 *
 * - sent_position: 已发送到的位置。
 * - limit_position = acked_position + window，窗口由 FlowControlStrategy 给出，
 *   acked_position 来自最近一条状态消息。
 *
 * @section 心跳
 * 心跳定时器触发后置位 heartbeat_due；若本轮没有发送任何数据，
 * 就发送一个零负载数据帧 (frame_length == 32)。
 */
class SenderChannel {
public:
  SenderChannel(UdpDestination destination, std::uint64_t session_id,
                std::uint64_t channel_id, std::shared_ptr<MappedRegion> region,
                std::shared_ptr<UdpTransport> transport,
                std::unique_ptr<FlowControlStrategy> flow_control)
      : destination_(std::move(destination)), session_id_(session_id),
        channel_id_(channel_id), region_(std::move(region)),
        transport_(std::move(transport)), flow_control_(std::move(flow_control)),
        log_(region_->buffer()), active_index_(log_.active_index()),
        term_id_(log_.term_id(active_index_)),
        window_(flow_control_->initial_window()) {
    DataHeaderFlyweight hb(heartbeat_view_, 0);
    heartbeat_view_.put_bytes(0, log_.default_header(), 0,
                              DataHeaderFlyweight::HEADER_LENGTH);
    hb.frame_length(DataHeaderFlyweight::HEADER_LENGTH);
    hb.flags(DataHeaderFlyweight::BEGIN_AND_END_FLAGS);
    hb.header_type(HeaderFlyweight::HDR_TYPE_DATA);
  }

  SenderChannel(const SenderChannel &) = delete;
  SenderChannel &operator=(const SenderChannel &) = delete;

  /**
   * @brief 发送一轮
   * @return 发出的数据报个数 (含心跳)
   */
  int send() {
    int sent = 0;

    // 一轮最多跨越全部分区一次
    for (std::int32_t i = 0; i < term_log_descriptor::PARTITION_COUNT; ++i) {
      const AtomicBuffer term = log_.term(active_index_);
      const std::int64_t limit = limit_position();
      bool blocked = false;

      for (const FrameDescriptor &frame : LogScanner(term).frames(sent_offset_)) {
        if (!frame.is_padding()) {
          if (position(sent_offset_) + frame.aligned_length() > limit) {
            blocked = true;
            break;
          }

          const auto result = transport_->send(std::span<const std::uint8_t>(
              term.data() + frame.term_offset,
              static_cast<std::size_t>(frame.frame_length)));
          if (result == SendResult::Backpressure) {
            blocked = true;
            break;
          }
          if (result == SendResult::Failed) {
            MDR_LOG_WARN("sender", "dropped frame session={} channel={} to {}: {}",
                         session_id_, channel_id_, destination_.canonical(),
                         std::strerror(errno));
          }
          ++sent;
        }
        sent_offset_ = frame.term_offset + frame.aligned_length();
      }

      if (blocked || sent_offset_ < term.capacity()) {
        break;
      }
      rotate();
    }

    if (sent > 0) {
      heartbeat_due_ = false;
    } else if (heartbeat_due_ && send_heartbeat()) {
      heartbeat_due_ = false;
      ++sent;
    }

    return sent;
  }

  /// 确认位置不会超过已发送位置，超出部分按已发送位置处理
  void on_status_message(const StatusUpdate &update) {
    acked_position_ = std::max(
        acked_position_,
        std::min(position(update.term_id, update.highest_contiguous_term_offset),
                 sent_position()));
    window_ = flow_control_->on_status_message(update);
  }

  void heartbeat_due() noexcept { heartbeat_due_ = true; }
  [[nodiscard]] bool is_heartbeat_due() const noexcept { return heartbeat_due_; }

  [[nodiscard]] std::int64_t sent_position() const noexcept {
    return position(sent_offset_);
  }
  [[nodiscard]] std::int64_t limit_position() const noexcept {
    return acked_position_ + window_;
  }
  [[nodiscard]] std::int32_t term_id() const noexcept { return term_id_; }
  [[nodiscard]] std::int32_t term_offset() const noexcept { return sent_offset_; }

  [[nodiscard]] const UdpDestination &destination() const noexcept {
    return destination_;
  }
  [[nodiscard]] std::uint64_t session_id() const noexcept { return session_id_; }
  [[nodiscard]] std::uint64_t channel_id() const noexcept { return channel_id_; }

  TimerWheel::TimerId heartbeat_timer;

private:
  [[nodiscard]] std::int64_t position(std::int32_t term_id,
                                      std::int32_t offset) const noexcept {
    const auto terms = static_cast<std::int64_t>(
        static_cast<std::uint32_t>(term_id) -
        static_cast<std::uint32_t>(log_.initial_term_id()));
    return terms * log_.term_capacity() + offset;
  }
  [[nodiscard]] std::int64_t position(std::int32_t offset) const noexcept {
    return position(term_id_, offset);
  }

  /// 当前 term 已全部发送：清理后交还给 Publication，进入下一个 term
  void rotate() noexcept {
    log_.clean(active_index_);
    active_index_ = term_log_descriptor::next_index(active_index_);
    ++term_id_;
    sent_offset_ = 0;
  }

  bool send_heartbeat() {
    DataHeaderFlyweight hb(heartbeat_view_, 0);
    hb.term_offset(sent_offset_);
    hb.term_id(term_id_);

    const auto result = transport_->send(std::span<const std::uint8_t>(
        heartbeat_frame_.data(), heartbeat_frame_.size()));
    if (result == SendResult::Failed) {
      MDR_LOG_WARN("sender", "heartbeat failed session={} channel={}: {}",
                   session_id_, channel_id_, std::strerror(errno));
    }
    return result != SendResult::Backpressure;
  }

  UdpDestination destination_;
  std::uint64_t session_id_;
  std::uint64_t channel_id_;
  std::shared_ptr<MappedRegion> region_;
  std::shared_ptr<UdpTransport> transport_;
  std::unique_ptr<FlowControlStrategy> flow_control_;

  TermLog log_;
  std::int32_t active_index_;
  std::int32_t term_id_;
  std::int32_t sent_offset_ = 0;

  std::int64_t acked_position_ = 0;
  std::int64_t window_;
  bool heartbeat_due_ = false;

  alignas(8) std::array<std::uint8_t, DataHeaderFlyweight::HEADER_LENGTH>
      heartbeat_frame_{};
  AtomicBuffer heartbeat_view_{heartbeat_frame_.data(),
                               DataHeaderFlyweight::HEADER_LENGTH};
};

} // namespace mdr
