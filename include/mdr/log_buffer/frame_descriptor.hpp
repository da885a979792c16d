#pragma once

#include "mdr/protocol/header_flyweight.hpp"
#include <cstdint>

namespace mdr {

/**
 * @brief Term 内帧的描述与对齐规则
 *
 * 帧按 FRAME_ALIGNMENT 对齐存放，frame_length 为 0 表示该位置尚未提交。
 */
namespace frame_descriptor {
constexpr std::int32_t FRAME_ALIGNMENT = 8;
constexpr std::int32_t BASE_HEADER_LENGTH = HeaderFlyweight::HEADER_LENGTH;

constexpr std::int32_t length_offset(std::int32_t frame_offset) noexcept {
  return frame_offset + HeaderFlyweight::FRAME_LENGTH_FIELD_OFFSET;
}
constexpr std::int32_t flags_offset(std::int32_t frame_offset) noexcept {
  return frame_offset + HeaderFlyweight::FLAGS_FIELD_OFFSET;
}
constexpr std::int32_t type_offset(std::int32_t frame_offset) noexcept {
  return frame_offset + HeaderFlyweight::TYPE_FIELD_OFFSET;
}
constexpr std::int32_t term_offset_offset(std::int32_t frame_offset) noexcept {
  return frame_offset + DataHeaderFlyweight::TERM_OFFSET_FIELD_OFFSET;
}
constexpr std::int32_t term_id_offset(std::int32_t frame_offset) noexcept {
  return frame_offset + DataHeaderFlyweight::TERM_ID_FIELD_OFFSET;
}

/// 单帧可承载的最大负载
constexpr std::int32_t max_payload(std::int32_t mtu) noexcept {
  return mtu - DataHeaderFlyweight::HEADER_LENGTH;
}
} // namespace frame_descriptor

/// 扫描器产出的已提交帧
struct FrameDescriptor {
  std::int32_t term_offset = 0;
  std::int32_t frame_length = 0;
  std::uint16_t type = HeaderFlyweight::HDR_TYPE_PAD;
  std::uint8_t flags = 0;

  [[nodiscard]] std::int32_t aligned_length() const noexcept {
    return align(frame_length, frame_descriptor::FRAME_ALIGNMENT);
  }
  [[nodiscard]] bool is_padding() const noexcept {
    return type == HeaderFlyweight::HDR_TYPE_PAD;
  }
};

} // namespace mdr
