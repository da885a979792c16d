#pragma once

#include "mdr/protocol/header_flyweight.hpp"
#include "mdr/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace mdr {

/**
 * @brief ADD_CHANNEL / REMOVE_CHANNEL 请求体
 *
 * | offset | field       | type                     |
 * |--------|-------------|--------------------------|
 * | 0      | channel_id  | u64                      |
 * | 8      | session_id  | u64                      |
 * | 16     | destination | i32 长度 + UTF-8 字节     |
 */
class ChannelMessageFlyweight : public Flyweight {
public:
  static constexpr std::int32_t CHANNEL_ID_OFFSET = 0;
  static constexpr std::int32_t SESSION_ID_OFFSET = 8;
  static constexpr std::int32_t DESTINATION_OFFSET = 16;

  ChannelMessageFlyweight() = default;
  ChannelMessageFlyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : Flyweight(buffer, offset) {}

  ChannelMessageFlyweight &wrap(const AtomicBuffer &buffer,
                                std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] std::uint64_t channel_id() const noexcept {
    return buffer_.get_uint64(offset_ + CHANNEL_ID_OFFSET);
  }
  ChannelMessageFlyweight &channel_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + CHANNEL_ID_OFFSET, v);
    return *this;
  }

  [[nodiscard]] std::uint64_t session_id() const noexcept {
    return buffer_.get_uint64(offset_ + SESSION_ID_OFFSET);
  }
  ChannelMessageFlyweight &session_id(std::uint64_t v) noexcept {
    buffer_.put_uint64(offset_ + SESSION_ID_OFFSET, v);
    return *this;
  }

  /// @throws DecodeError 长度前缀越界
  [[nodiscard]] std::string_view destination() const {
    return buffer_.get_string_view(offset_ + DESTINATION_OFFSET);
  }

  /// @throws std::out_of_range 缓冲区放不下
  ChannelMessageFlyweight &destination(std::string_view v) {
    buffer_.check_bounds(offset_ + DESTINATION_OFFSET,
                         static_cast<std::int32_t>(sizeof(std::int32_t) + v.size()));
    buffer_.put_string(offset_ + DESTINATION_OFFSET, v);
    return *this;
  }

  /// 编码后的总长度 (需先写入 destination)
  [[nodiscard]] std::int32_t length() const noexcept {
    return DESTINATION_OFFSET + static_cast<std::int32_t>(sizeof(std::int32_t)) +
           buffer_.get_int32(offset_ + DESTINATION_OFFSET);
  }
};

} // namespace mdr
