#pragma once

#include <cstdint>
#include <string_view>

namespace mdr {

/**
 * @brief 客户端与 Driver 之间的控制事件类型 (环形缓冲区记录的 type_id)
 *
 * 1 ~ 0x0F 为客户端 -> Driver 的请求，0x10 之后预留给扩展。
 */
namespace control_protocol {
constexpr std::int32_t ADD_CHANNEL = 0x01;
constexpr std::int32_t REMOVE_CHANNEL = 0x02;
constexpr std::int32_t NEW_SEND_BUFFER_NOTIFICATION = 0x03;
constexpr std::int32_t ERROR_RESPONSE = 0x04;

constexpr std::string_view event_name(std::int32_t type_id) noexcept {
  switch (type_id) {
  case ADD_CHANNEL:
    return "ADD_CHANNEL";
  case REMOVE_CHANNEL:
    return "REMOVE_CHANNEL";
  case NEW_SEND_BUFFER_NOTIFICATION:
    return "NEW_SEND_BUFFER_NOTIFICATION";
  case ERROR_RESPONSE:
    return "ERROR_RESPONSE";
  default:
    return "UNKNOWN";
  }
}
} // namespace control_protocol

/// 错误应答中的错误码
enum class ErrorCode : std::int32_t {
  GenericError = 0,
  ChannelAlreadyExists = 1,
  InvalidDestination = 2,
  ChannelUnknown = 3,
  ResourceUnavailable = 4,
  MalformedRequest = 5,
};

constexpr std::string_view error_code_name(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::GenericError:
    return "GENERIC_ERROR";
  case ErrorCode::ChannelAlreadyExists:
    return "CHANNEL_ALREADY_EXISTS";
  case ErrorCode::InvalidDestination:
    return "INVALID_DESTINATION";
  case ErrorCode::ChannelUnknown:
    return "CHANNEL_UNKNOWN";
  case ErrorCode::ResourceUnavailable:
    return "RESOURCE_UNAVAILABLE";
  case ErrorCode::MalformedRequest:
    return "MALFORMED_REQUEST";
  }
  return "UNKNOWN";
}

} // namespace mdr
