#pragma once

#include <cstdint>
#include <memory>

namespace mdr {

/// 状态消息中与流控相关的字段
struct StatusUpdate {
  std::int32_t term_id = 0;
  std::int32_t highest_contiguous_term_offset = 0;
  std::int32_t receiver_window = 0;
};

/**
 * @brief 发送端流控策略
 *
 * Sender 的可发送上限 limit = acked_position + window，window 由策略给出。
 * 每个会话持有自己的策略实例，每收到一条状态消息调用一次。
 */
class FlowControlStrategy {
public:
  virtual ~FlowControlStrategy() = default;

  /// 收到第一条状态消息之前的窗口
  [[nodiscard]] virtual std::int64_t initial_window() const = 0;

  /// @return 当前窗口长度 (字节)
  virtual std::int64_t on_status_message(const StatusUpdate &update) = 0;
};

/**
 * @brief 默认策略：窗口无上限，只受 Term Log 中已提交的数据限制
 */
class UnboundedFlowControl final : public FlowControlStrategy {
public:
  static constexpr std::int64_t UNBOUNDED_WINDOW = std::int64_t{1} << 62;

  [[nodiscard]] std::int64_t initial_window() const override {
    return UNBOUNDED_WINDOW;
  }
  std::int64_t on_status_message(const StatusUpdate &) override {
    return UNBOUNDED_WINDOW;
  }
};

/**
 * @brief 以接收端通告的窗口作为发送窗口
 *
 * initial_window 为 0 时，收到第一条状态消息之前不发送任何数据
 * (心跳不受影响)。
 */
class ReceiverWindowFlowControl final : public FlowControlStrategy {
public:
  explicit ReceiverWindowFlowControl(std::int64_t initial_window = 0)
      : initial_window_(initial_window) {}

  [[nodiscard]] std::int64_t initial_window() const override {
    return initial_window_;
  }

  std::int64_t on_status_message(const StatusUpdate &update) override {
    return update.receiver_window > 0 ? update.receiver_window : 0;
  }

private:
  std::int64_t initial_window_;
};

inline std::unique_ptr<FlowControlStrategy> make_default_flow_control() {
  return std::make_unique<UnboundedFlowControl>();
}

} // namespace mdr
