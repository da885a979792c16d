#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/log_buffer/frame_descriptor.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include "mdr/protocol/header_flyweight.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mdr {

/**
 * @brief 单个 term 的追加写入器 (单写者)
 *
 * 每条消息写成一帧；超过 mtu 的消息拆成带 BEGIN / END 标志的分片。
 *
 * @section 提交顺序
 * 1. 拷贝默认帧头 (frame_length 为 0)，填 term_offset / term_id / flags。
 * 2. 拷贝负载。
 * 3. 最后以 Release 写 frame_length，读者以 Acquire 读到非 0 即可见整帧。
 *
 * 剩余空间放不下整条消息时，写一个 PAD 帧填满 term，返回 false，
 * 之后 is_exhausted() 为 true，由 Publication 负责轮转。
 */
class LogAppender {
public:
  LogAppender(const TermLog &log, std::int32_t partition_index)
      : log_(log), term_(log.term(partition_index)),
        partition_index_(partition_index),
        max_payload_(frame_descriptor::max_payload(log.mtu())),
        max_message_length_(log.term_capacity() / 8) {}

  /**
   * @return true 写入成功; false term 已写满 (已填充 PAD)
   * @throws std::invalid_argument length 超过 max_message_length()
   */
  [[nodiscard]] bool append(const AtomicBuffer &src, std::int32_t offset,
                            std::int32_t length) {
    if (length < 0 || length > max_message_length_) {
      throw std::invalid_argument(
          "message length " + std::to_string(length) + " exceeds max " +
          std::to_string(max_message_length_));
    }

    const std::int32_t capacity = term_.capacity();
    const std::int32_t tail = log_.tail(partition_index_);
    const std::int32_t required = required_capacity(length);

    if (tail + required > capacity) {
      pad(tail);
      return false;
    }

    const std::int32_t term_id = log_.term_id(partition_index_);
    std::int32_t frame_offset = tail;

    if (length <= max_payload_) {
      write_frame(frame_offset, term_id, DataHeaderFlyweight::BEGIN_AND_END_FLAGS,
                  src, offset, length);
      frame_offset += align(length + DataHeaderFlyweight::HEADER_LENGTH,
                            frame_descriptor::FRAME_ALIGNMENT);
    } else {
      std::int32_t remaining = length;
      std::uint8_t flags = DataHeaderFlyweight::BEGIN_FLAG;
      do {
        const std::int32_t chunk = remaining < max_payload_ ? remaining : max_payload_;
        if (chunk == remaining) {
          flags |= DataHeaderFlyweight::END_FLAG;
        }
        write_frame(frame_offset, term_id, flags, src,
                    offset + (length - remaining), chunk);
        frame_offset += align(chunk + DataHeaderFlyweight::HEADER_LENGTH,
                              frame_descriptor::FRAME_ALIGNMENT);
        remaining -= chunk;
        flags = 0;
      } while (remaining > 0);
    }

    log_.tail_ordered(partition_index_, frame_offset);
    return true;
  }

  [[nodiscard]] std::int32_t tail() const noexcept {
    return log_.tail(partition_index_);
  }
  [[nodiscard]] bool is_exhausted() const noexcept {
    return tail() >= term_.capacity();
  }
  [[nodiscard]] std::int32_t partition_index() const noexcept {
    return partition_index_;
  }
  [[nodiscard]] std::int32_t max_payload_length() const noexcept {
    return max_payload_;
  }
  [[nodiscard]] std::int32_t max_message_length() const noexcept {
    return max_message_length_;
  }

private:
  [[nodiscard]] std::int32_t required_capacity(std::int32_t length) const noexcept {
    constexpr std::int32_t header = DataHeaderFlyweight::HEADER_LENGTH;
    const std::int32_t full_frames = length / max_payload_;
    const std::int32_t remainder = length % max_payload_;

    std::int32_t required =
        full_frames * align(max_payload_ + header, frame_descriptor::FRAME_ALIGNMENT);
    if (remainder > 0 || full_frames == 0) {
      required += align(remainder + header, frame_descriptor::FRAME_ALIGNMENT);
    }
    return required;
  }

  void write_frame(std::int32_t frame_offset, std::int32_t term_id,
                   std::uint8_t flags, const AtomicBuffer &src,
                   std::int32_t src_offset, std::int32_t length) noexcept {
    term_.put_bytes(frame_offset, log_.default_header(), 0,
                    DataHeaderFlyweight::HEADER_LENGTH);

    DataHeaderFlyweight header(term_, frame_offset);
    header.flags(flags);
    header.term_offset(frame_offset);
    header.term_id(term_id);

    term_.put_bytes(frame_offset + DataHeaderFlyweight::HEADER_LENGTH, src,
                    src_offset, length);

    term_.put_int32_ordered(frame_descriptor::length_offset(frame_offset),
                            length + DataHeaderFlyweight::HEADER_LENGTH);
  }

  void pad(std::int32_t tail) noexcept {
    const std::int32_t capacity = term_.capacity();
    if (tail < capacity) {
      term_.put_uint16(frame_descriptor::type_offset(tail),
                       HeaderFlyweight::HDR_TYPE_PAD);
      term_.put_int32_ordered(frame_descriptor::length_offset(tail),
                              capacity - tail);
    }
    log_.tail_ordered(partition_index_, capacity);
  }

  TermLog log_;
  AtomicBuffer term_;
  std::int32_t partition_index_;
  std::int32_t max_payload_;
  std::int32_t max_message_length_;
};

} // namespace mdr
