#pragma once

#include "mdr/protocol/header_flyweight.hpp"
#include "mdr/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace mdr {

/**
 * @brief NEW_SEND_BUFFER_NOTIFICATION 应答体
 *
 * [ session_id u64 ][ channel_id u64 ][ destination ][ location ]
 *
 * destination 与 location 都是 i32 长度前缀字符串，location 紧跟在
 * destination 之后，是 Term Log 文件路径，客户端据此映射同一块内存。
 * 写入时必须先写 destination 再写 location。
 */
class NewBufferMessageFlyweight : public Flyweight {
public:
  static constexpr std::int32_t SESSION_ID_OFFSET = 0;
  static constexpr std::int32_t CHANNEL_ID_OFFSET = 8;
  static constexpr std::int32_t DESTINATION_OFFSET = 16;

  /// 给定 destination / location 字节数时编码后的总长度
  static constexpr std::int64_t compute_length(std::size_t destination_length,
                                               std::size_t location_length) noexcept {
    return DESTINATION_OFFSET + 2 * static_cast<std::int64_t>(sizeof(std::int32_t)) +
           static_cast<std::int64_t>(destination_length) +
           static_cast<std::int64_t>(location_length);
  }

  NewBufferMessageFlyweight() = default;
  NewBufferMessageFlyweight(const AtomicBuffer &buffer,
                            std::int32_t offset) noexcept
      : Flyweight(buffer, offset) {}

  NewBufferMessageFlyweight &wrap(const AtomicBuffer &buffer,
                                  std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] std::uint64_t session_id() const noexcept {
    return buffer_.get_uint64(offset_ + SESSION_ID_OFFSET);
  }
  NewBufferMessageFlyweight &session_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + SESSION_ID_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint64_t channel_id() const noexcept {
    return buffer_.get_uint64(offset_ + CHANNEL_ID_OFFSET);
  }
  NewBufferMessageFlyweight &channel_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + CHANNEL_ID_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::string_view destination() const {
    return buffer_.get_string_view(offset_ + DESTINATION_OFFSET);
  }
  NewBufferMessageFlyweight &destination(std::string_view v) {
    put_checked(offset_ + DESTINATION_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::string_view location() const {
    return buffer_.get_string_view(location_offset());
  }
  NewBufferMessageFlyweight &location(std::string_view v) {
    put_checked(location_offset(), v);
    return *this;
  }

  [[nodiscard]] std::int32_t length() const noexcept {
    return location_offset() - offset_ +
           static_cast<std::int32_t>(sizeof(std::int32_t)) +
           buffer_.get_int32(location_offset());
  }

private:
  [[nodiscard]] std::int32_t location_offset() const noexcept {
    return offset_ + DESTINATION_OFFSET +
           static_cast<std::int32_t>(sizeof(std::int32_t)) +
           buffer_.get_int32(offset_ + DESTINATION_OFFSET);
  }

  void put_checked(std::int32_t index, std::string_view v) {
    buffer_.check_bounds(
        index, static_cast<std::int32_t>(sizeof(std::int32_t) + v.size()));
    buffer_.put_string(index, v);
  }
};

} // namespace mdr
