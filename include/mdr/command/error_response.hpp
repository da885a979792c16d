#pragma once

#include "mdr/command/control_protocol.hpp"
#include "mdr/protocol/header_flyweight.hpp"
#include "mdr/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace mdr {

/**
 * @brief ERROR_RESPONSE 应答体
 *
 * | offset | field                   | type |
 * |--------|-------------------------|------|
 * | 0      | error_code              | i32  |
 * | 4      | offending_header_offset | i32  | (相对本记录起点)
 * | 8      | offending_header_length | i32  |
 * | 12     | error_string_length     | i32  |
 * | 16     | error_string            | bytes|
 * | ...    | offending request       | bytes| (8 字节对齐)
 *
 * 应答总是携带出错请求的完整编码，客户端可以直接
 * `ChannelMessageFlyweight{buffer, error.offending_header_offset()}` 解析。
 * 写入顺序: error_code -> error_message -> offending_header。
 */
class ErrorFlyweight : public Flyweight {
public:
  static constexpr std::int32_t ERROR_CODE_OFFSET = 0;
  static constexpr std::int32_t OFFENDING_HEADER_OFFSET_OFFSET = 4;
  static constexpr std::int32_t OFFENDING_HEADER_LENGTH_OFFSET = 8;
  static constexpr std::int32_t ERROR_STRING_LENGTH_OFFSET = 12;
  static constexpr std::int32_t ERROR_STRING_OFFSET = 16;
  static constexpr std::int32_t HEADER_LENGTH = ERROR_STRING_OFFSET;

  ErrorFlyweight() = default;
  ErrorFlyweight(const AtomicBuffer &buffer, std::int32_t offset) noexcept
      : Flyweight(buffer, offset) {}

  ErrorFlyweight &wrap(const AtomicBuffer &buffer,
                       std::int32_t offset = 0) noexcept {
    reset(buffer, offset);
    return *this;
  }

  [[nodiscard]] ErrorCode error_code() const noexcept {
    return static_cast<ErrorCode>(buffer_.get_int32(offset_ + ERROR_CODE_OFFSET));
  }
  ErrorFlyweight &error_code(ErrorCode code) noexcept {
    buffer_.put_int32(offset_ + ERROR_CODE_OFFSET, static_cast<std::int32_t>(code));
    return *this;
  }

  [[nodiscard]] std::int32_t error_string_length() const noexcept {
    return buffer_.get_int32(offset_ + ERROR_STRING_LENGTH_OFFSET);
  }

  /// @throws DecodeError 长度越界
  [[nodiscard]] std::string error_message() const {
    const std::int32_t len = error_string_length();
    check_region(offset_ + ERROR_STRING_OFFSET, len, "error string");
    std::string out(static_cast<std::size_t>(len), '\0');
    buffer_.get_bytes(offset_ + ERROR_STRING_OFFSET,
                      reinterpret_cast<std::uint8_t *>(out.data()), len);
    return out;
  }

  ErrorFlyweight &error_message(std::string_view msg) {
    const auto len = static_cast<std::int32_t>(msg.size());
    buffer_.check_bounds(offset_ + ERROR_STRING_OFFSET, len);
    buffer_.put_int32(offset_ + ERROR_STRING_LENGTH_OFFSET, len);
    buffer_.put_bytes(offset_ + ERROR_STRING_OFFSET,
                      reinterpret_cast<const std::uint8_t *>(msg.data()), len);
    return *this;
  }

  /// 出错请求在被包装缓冲区中的绝对下标
  [[nodiscard]] std::int32_t offending_header_offset() const {
    const std::int32_t absolute =
        offset_ + buffer_.get_int32(offset_ + OFFENDING_HEADER_OFFSET_OFFSET);
    check_region(absolute, offending_header_length(), "offending header");
    return absolute;
  }

  [[nodiscard]] std::int32_t offending_header_length() const noexcept {
    return buffer_.get_int32(offset_ + OFFENDING_HEADER_LENGTH_OFFSET);
  }

  /**
   * @brief 拷贝出错请求的编码 (紧跟错误字符串，8 字节对齐)
   */
  ErrorFlyweight &offending_header(const AtomicBuffer &src, std::int32_t index,
                                   std::int32_t length) {
    const std::int32_t relative =
        align(ERROR_STRING_OFFSET + error_string_length(), 8);
    buffer_.check_bounds(offset_ + relative, length);
    buffer_.put_int32(offset_ + OFFENDING_HEADER_OFFSET_OFFSET, relative);
    buffer_.put_int32(offset_ + OFFENDING_HEADER_LENGTH_OFFSET, length);
    buffer_.put_bytes(offset_ + relative, src, index, length);
    return *this;
  }

  /// 编码后的总长度
  [[nodiscard]] std::int32_t length() const noexcept {
    return buffer_.get_int32(offset_ + OFFENDING_HEADER_OFFSET_OFFSET) +
           offending_header_length();
  }

private:
  void check_region(std::int32_t index, std::int32_t length,
                    const char *what) const {
    if (index < 0 || length < 0 ||
        static_cast<std::int64_t>(index) + length > buffer_.capacity()) {
      throw DecodeError(std::string("invalid ") + what + " region at " +
                        std::to_string(index) + " length " +
                        std::to_string(length));
    }
  }
};

} // namespace mdr
