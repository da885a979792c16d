#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include <cstdint>

namespace mdr {

/**
 * @brief Flyweight 基类：AtomicBuffer + 偏移量上的类型化视图
 *
 * 不拥有内存，不分配；同一个 Flyweight 对象可以反复 wrap 到不同位置，
 * 逐帧解析时不产生任何拷贝。
 */
class Flyweight {
public:
  Flyweight() = default;
  Flyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : buffer_(buffer), offset_(offset) {}

  [[nodiscard]] const AtomicBuffer &buffer() const noexcept { return buffer_; }
  [[nodiscard]] std::int32_t offset() const noexcept { return offset_; }

protected:
  void reset(const AtomicBuffer &buffer, std::int32_t offset) noexcept {
    buffer_ = buffer;
    offset_ = offset;
  }

  AtomicBuffer buffer_;
  std::int32_t offset_ = 0;
};

/**
 * @brief 所有数据面帧的公共头 (8 字节)
 *
 * | offset | field        | type |
 * |--------|--------------|------|
 * | 0      | frame_length | i32  |
 * | 4      | version      | u8   |
 * | 5      | flags        | u8   |
 * | 6      | header_type  | u16  |
 *
 * frame_length 包含头部本身；在 Term Log 中它是提交标记，最后写入。
 */
class HeaderFlyweight : public Flyweight {
public:
  static constexpr std::int32_t HEADER_LENGTH = 8;

  static constexpr std::uint8_t CURRENT_VERSION = 0x0;

  static constexpr std::uint16_t HDR_TYPE_PAD = 0x00;
  static constexpr std::uint16_t HDR_TYPE_DATA = 0x01;
  static constexpr std::uint16_t HDR_TYPE_NAK = 0x02;
  static constexpr std::uint16_t HDR_TYPE_SM = 0x03;

  static constexpr std::int32_t FRAME_LENGTH_FIELD_OFFSET = 0;
  static constexpr std::int32_t VERSION_FIELD_OFFSET = 4;
  static constexpr std::int32_t FLAGS_FIELD_OFFSET = 5;
  static constexpr std::int32_t TYPE_FIELD_OFFSET = 6;

  HeaderFlyweight() = default;
  HeaderFlyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : Flyweight(buffer, offset) {}

  HeaderFlyweight &wrap(const AtomicBuffer &buffer,
                        std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] std::int32_t frame_length() const noexcept {
    return buffer_.get_int32(offset_ + FRAME_LENGTH_FIELD_OFFSET);
  }
  HeaderFlyweight &frame_length(std::int32_t v) noexcept {
    buffer_.put_int32(offset_ + FRAME_LENGTH_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint8_t version() const noexcept {
    return buffer_.get_uint8(offset_ + VERSION_FIELD_OFFSET);
  }
  HeaderFlyweight &version(std::uint8_t v) noexcept {
    buffer_.put_uint8(offset_ + VERSION_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint8_t flags() const noexcept {
    return buffer_.get_uint8(offset_ + FLAGS_FIELD_OFFSET);
  }
  HeaderFlyweight &flags(std::uint8_t v) noexcept {
    buffer_.put_uint8(offset_ + FLAGS_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint16_t header_type() const noexcept {
    return buffer_.get_uint16(offset_ + TYPE_FIELD_OFFSET);
  }
  HeaderFlyweight &header_type(std::uint16_t v) noexcept {
    buffer_.put_uint16(offset_ + TYPE_FIELD_OFFSET, v);
    return *this;
  }
};

/**
 * @brief 数据帧头 (32 字节)
 *
 * 在公共头之后依次为 term_offset i32 @8, term_id i32 @12,
 * session_id u64 @16, channel_id u64 @24。
 * frame_length == HEADER_LENGTH 的数据帧即心跳。
 */
class DataHeaderFlyweight : public HeaderFlyweight {
public:
  static constexpr std::int32_t HEADER_LENGTH = 32;

  static constexpr std::uint8_t BEGIN_FLAG = 0x80;
  static constexpr std::uint8_t END_FLAG = 0x40;
  static constexpr std::uint8_t BEGIN_AND_END_FLAGS = BEGIN_FLAG | END_FLAG;

  static constexpr std::int32_t TERM_OFFSET_FIELD_OFFSET = 8;
  static constexpr std::int32_t TERM_ID_FIELD_OFFSET = 12;
  static constexpr std::int32_t SESSION_ID_FIELD_OFFSET = 16;
  static constexpr std::int32_t CHANNEL_ID_FIELD_OFFSET = 24;

  DataHeaderFlyweight() = default;
  DataHeaderFlyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : HeaderFlyweight(buffer, offset) {}

  DataHeaderFlyweight &wrap(const AtomicBuffer &buffer,
                            std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] std::int32_t term_offset() const noexcept {
    return buffer_.get_int32(offset_ + TERM_OFFSET_FIELD_OFFSET);
  }
  DataHeaderFlyweight &term_offset(std::int32_t v) noexcept {
    buffer_.put_int32(offset_ + TERM_OFFSET_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::int32_t term_id() const noexcept {
    return buffer_.get_int32(offset_ + TERM_ID_FIELD_OFFSET);
  }
  DataHeaderFlyweight &term_id(std::int32_t v) noexcept {
    buffer_.put_int32(offset_ + TERM_ID_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint64_t session_id() const noexcept {
    return buffer_.get_uint64(offset_ + SESSION_ID_FIELD_OFFSET);
  }
  DataHeaderFlyweight &session_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + SESSION_ID_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint64_t channel_id() const noexcept {
    return buffer_.get_uint64(offset_ + CHANNEL_ID_FIELD_OFFSET);
  }
  DataHeaderFlyweight &channel_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + CHANNEL_ID_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::int32_t data_offset() const noexcept {
    return offset_ + HEADER_LENGTH;
  }

  [[nodiscard]] bool is_heartbeat() const noexcept {
    return header_type() == HDR_TYPE_DATA && frame_length() == HEADER_LENGTH;
  }
};

/**
 * @brief 接收端回送的状态消息 (40 字节)
 *
 * 与数据帧头共享前 32 字节 (term_offset 之后的字段含义相同)，
 * 追加 highest_contiguous_term_offset i32 @32 与 receiver_window i32 @36。
 */
class StatusMessageFlyweight : public DataHeaderFlyweight {
public:
  static constexpr std::int32_t HEADER_LENGTH = 40;

  static constexpr std::int32_t HIGHEST_CONTIGUOUS_TERM_OFFSET_FIELD_OFFSET = 32;
  static constexpr std::int32_t RECEIVER_WINDOW_FIELD_OFFSET = 36;

  StatusMessageFlyweight() = default;
  StatusMessageFlyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : DataHeaderFlyweight(buffer, offset) {}

  StatusMessageFlyweight &wrap(const AtomicBuffer &buffer,
                               std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] std::int32_t highest_contiguous_term_offset() const noexcept {
    return buffer_.get_int32(offset_ + HIGHEST_CONTIGUOUS_TERM_OFFSET_FIELD_OFFSET);
  }
  StatusMessageFlyweight &highest_contiguous_term_offset(std::int32_t v) noexcept {
    buffer_.put_int32(offset_ + HIGHEST_CONTIGUOUS_TERM_OFFSET_FIELD_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::int32_t receiver_window() const noexcept {
    return buffer_.get_int32(offset_ + RECEIVER_WINDOW_FIELD_OFFSET);
  }
  StatusMessageFlyweight &receiver_window(std::int32_t v) noexcept {
    buffer_.put_int32(offset_ + RECEIVER_WINDOW_FIELD_OFFSET, v);
    return *this;
  }
};

} // namespace mdr
