#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/log_buffer/log_appender.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include <array>
#include <cstdint>

namespace mdr {

/**
 * @brief 客户端侧的发布入口：在三个 term 之间轮转追加
 *
 * 当前 term 写满后，只有下一个 term 为 CLEAN (Sender 已发送并清理) 时才
 * 轮转进入；否则 offer 返回 false，调用方稍后重试。因此轮转永远不会覆盖
 * 尚未发送的帧。
 *
 * @note 单写者。每个 Term Log 同时只能有一个 Publication。
 */
class Publication {
public:
  explicit Publication(const TermLog &log)
      : log_(log), appenders_{LogAppender(log, 0), LogAppender(log, 1),
                              LogAppender(log, 2)},
        active_index_(log.active_index()) {}

  /**
   * @return true 已追加; false 背压 (下一个 term 尚未清理)
   * @throws std::invalid_argument 消息超过 max_message_length()
   */
  [[nodiscard]] bool offer(const AtomicBuffer &src, std::int32_t offset,
                           std::int32_t length) {
    if (appenders_[active_index_].append(src, offset, length)) {
      return true;
    }
    if (!rotate()) {
      return false;
    }
    return appenders_[active_index_].append(src, offset, length);
  }

  [[nodiscard]] std::int32_t active_index() const noexcept {
    return active_index_;
  }
  [[nodiscard]] std::int32_t term_id() const noexcept {
    return log_.term_id(active_index_);
  }
  [[nodiscard]] std::int32_t max_message_length() const noexcept {
    return appenders_[0].max_message_length();
  }
  [[nodiscard]] std::uint64_t session_id() const noexcept {
    return log_.session_id();
  }
  [[nodiscard]] std::uint64_t channel_id() const noexcept {
    return log_.channel_id();
  }

private:
  bool rotate() noexcept {
    const std::int32_t next = term_log_descriptor::next_index(active_index_);
    if (log_.status(next) != term_log_descriptor::CLEAN) {
      return false;
    }

    log_.tail_ordered(next, 0);
    log_.term_id_ordered(next, log_.term_id(active_index_) + 1);
    log_.status_ordered(next, term_log_descriptor::IN_USE);
    log_.active_index_ordered(next);
    active_index_ = next;
    return true;
  }

  TermLog log_;
  std::array<LogAppender, term_log_descriptor::PARTITION_COUNT> appenders_;
  std::int32_t active_index_;
};

} // namespace mdr
