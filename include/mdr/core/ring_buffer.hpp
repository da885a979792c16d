#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/types.hpp"
#include <climits>
#include <concepts>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace mdr {

using namespace mdr::detail;

/**
 * @brief 环形缓冲区 trailer 布局
 *
 * trailer 紧跟在 capacity 字节的数据区之后，各计数器独占 Cache Line
 * (两条，防止相邻行预取导致的伪共享)：
 *
 * [ data (capacity) ...                ]
 * [ tail (8B) ... padding ... (128B)   ] <--- Producer CAS
 * [ head (8B) ... padding ... (128B)   ] <--- Consumer 独占写
 * [ correlation (8B) ... (128B)        ]
 */
namespace ring_buffer_descriptor {
constexpr std::int32_t TAIL_COUNTER_OFFSET = 0;
constexpr std::int32_t HEAD_COUNTER_OFFSET =
    TAIL_COUNTER_OFFSET + static_cast<std::int32_t>(CACHE_LINE_SIZE * 2);
constexpr std::int32_t CORRELATION_COUNTER_OFFSET =
    HEAD_COUNTER_OFFSET + static_cast<std::int32_t>(CACHE_LINE_SIZE * 2);
constexpr std::int32_t TRAILER_LENGTH =
    CORRELATION_COUNTER_OFFSET + static_cast<std::int32_t>(CACHE_LINE_SIZE * 2);
} // namespace ring_buffer_descriptor

/**
 * @brief 记录 (record) 布局
 *
 * [ length i32 ][ type_id i32 ][ body ... ] 按 8 字节对齐
 *
 * length 包含 8 字节记录头，由生产者最后以 release 写入 (commit)，
 * 消费者以 acquire 读取；length == 0 表示该位置尚未提交。
 */
namespace record_descriptor {
constexpr std::int32_t HEADER_LENGTH = 8;
constexpr std::int32_t ALIGNMENT = 8;
constexpr std::int32_t PADDING_MSG_TYPE_ID = -1;

constexpr std::int32_t length_offset(std::int32_t record_index) noexcept {
  return record_index;
}
constexpr std::int32_t type_offset(std::int32_t record_index) noexcept {
  return record_index + 4;
}
constexpr std::int32_t encoded_msg_offset(std::int32_t record_index) noexcept {
  return record_index + HEADER_LENGTH;
}
} // namespace record_descriptor

/**
 * @brief 多生产者-单消费者 (MPSC) 变长消息环形缓冲区
 *
 * 客户端与 Driver 之间唯一的命令通道，可以放在共享内存里跨进程使用。
 *
 * @section 特性
 * 1. Producer Lock-free: 通过 CAS 推进 tail 认领一段区域，写完消息体后
 * 最后写 length 提交。
 * 2. Consumer Wait-free: 唯一消费者独占 head，读完后清零已读区域再发布 head。
 * 3. 回绕: 尾部剩余空间不足时写入 padding 记录，消息从缓冲区起点开始。
 * 4. 背压: 空间不足时 write 返回 false，绝不阻塞、绝不覆盖未读数据。
 */
class ManyToOneRingBuffer {
public:
  static constexpr std::int32_t INSUFFICIENT_CAPACITY = -2;

  /**
   * @param buffer 数据区 + trailer，数据区容量必须是 2 的幂
   */
  explicit ManyToOneRingBuffer(AtomicBuffer buffer)
      : buffer_(buffer),
        capacity_(buffer.capacity() - ring_buffer_descriptor::TRAILER_LENGTH),
        mask_(capacity_ - 1),
        max_msg_length_(capacity_ / 8),
        tail_counter_index_(capacity_ +
                            ring_buffer_descriptor::TAIL_COUNTER_OFFSET),
        head_counter_index_(capacity_ +
                            ring_buffer_descriptor::HEAD_COUNTER_OFFSET),
        correlation_counter_index_(
            capacity_ + ring_buffer_descriptor::CORRELATION_COUNTER_OFFSET) {
    if (!is_power_of_two(capacity_)) {
      throw std::invalid_argument(
          "ring buffer capacity must be a power of 2 plus TRAILER_LENGTH: " +
          std::to_string(buffer.capacity()));
    }
  }

  [[nodiscard]] std::int32_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] std::int32_t max_msg_length() const noexcept {
    return max_msg_length_;
  }
  [[nodiscard]] const AtomicBuffer &buffer() const noexcept { return buffer_; }

  // ===========================================================================
  // Producer 操作 (多线程 / 多进程安全)
  // ===========================================================================

  /**
   * @brief 写入一条消息
   *
   * @param type_id 消息类型，必须 >= 1
   * @return true 写入成功; false 空间不足 (INSUFFICIENT_CAPACITY)，调用方重试或丢弃
   * @throws std::invalid_argument type_id 非法或消息超过 max_msg_length()
   */
  [[nodiscard]] bool write(std::int32_t type_id, const AtomicBuffer &src,
                           std::int32_t index, std::int32_t length) {
    using namespace record_descriptor;
    check_msg_type_id(type_id);
    check_msg_length(length);

    const std::int32_t record_length = length + HEADER_LENGTH;
    const std::int32_t required = align(record_length, ALIGNMENT);
    const std::int32_t record_index = claim_capacity(required);

    if (record_index == INSUFFICIENT_CAPACITY) {
      return false;
    }

    buffer_.put_int32(type_offset(record_index), type_id);
    buffer_.put_bytes(encoded_msg_offset(record_index), src, index, length);

    // commit: length 最后写入 (Release)
    buffer_.put_int32_ordered(length_offset(record_index), record_length);
    return true;
  }

  /**
   * @brief 生成全局唯一的关联 ID (跨生产者单调递增)
   */
  [[nodiscard]] std::int64_t next_correlation_id() noexcept {
    return buffer_.get_and_add_int64(correlation_counter_index_, 1);
  }

  // ===========================================================================
  // Consumer 操作 (单线程)
  // ===========================================================================

  /**
   * @brief 读取当前所有可见消息 (最多 limit 条)
   *
   * handler 签名: void(int32_t type_id, const AtomicBuffer &buffer,
   *                    int32_t index, int32_t length)
   *
   * @note 每条记录在交给 handler 之前就已计入已读字节；handler 抛异常时，
   * 已读区域仍然会被清零并发布 head，异常继续向上传播，消息不会被重复投递。
   *
   * @return 投递给 handler 的消息数 (不含 padding)
   */
  template <typename F>
    requires std::invocable<F, std::int32_t, const AtomicBuffer &,
                            std::int32_t, std::int32_t>
  int read(F &&handler, int limit = INT_MAX) {
    using namespace record_descriptor;

    const std::int64_t head = buffer_.get_int64(head_counter_index_);
    const std::int32_t head_index = static_cast<std::int32_t>(head) & mask_;
    const std::int32_t contiguous_block_length = capacity_ - head_index;

    // 守卫：无论 handler 是否抛出，都清零已读区域并推进 head
    struct ReadCommit {
      AtomicBuffer &buffer;
      std::int32_t head_counter_index;
      std::int64_t head;
      std::int32_t head_index;
      std::int32_t bytes_read = 0;

      ~ReadCommit() {
        if (bytes_read != 0) {
          buffer.set_memory(head_index, bytes_read, 0);
          buffer.put_int64_ordered(head_counter_index, head + bytes_read);
        }
      }
    } commit{buffer_, head_counter_index_, head, head_index};

    int messages_read = 0;
    while (commit.bytes_read < contiguous_block_length &&
           messages_read < limit) {
      const std::int32_t record_index = head_index + commit.bytes_read;
      const std::int32_t record_length =
          buffer_.get_int32_volatile(length_offset(record_index));
      if (record_length <= 0) {
        break;
      }

      commit.bytes_read += align(record_length, ALIGNMENT);

      const std::int32_t type_id = buffer_.get_int32(type_offset(record_index));
      if (type_id == PADDING_MSG_TYPE_ID) {
        continue;
      }

      ++messages_read;
      std::invoke(handler, type_id, std::as_const(buffer_),
                  encoded_msg_offset(record_index),
                  record_length - HEADER_LENGTH);
    }

    return messages_read;
  }

  // ===========================================================================
  // 状态查询
  // ===========================================================================

  /// 当前已占用字节数 (估计值，含记录头与 padding)
  [[nodiscard]] std::int32_t size() const noexcept {
    const std::int64_t head = buffer_.get_int64_volatile(head_counter_index_);
    const std::int64_t tail = buffer_.get_int64_volatile(tail_counter_index_);
    return static_cast<std::int32_t>(tail - head);
  }

private:
  void check_msg_type_id(std::int32_t type_id) const {
    if (type_id < 1) {
      throw std::invalid_argument("message type id must be >= 1: " +
                                  std::to_string(type_id));
    }
  }

  void check_msg_length(std::int32_t length) const {
    if (length < 0 || length > max_msg_length_) {
      throw std::invalid_argument(
          "encoded message length " + std::to_string(length) +
          " exceeds max " + std::to_string(max_msg_length_));
    }
  }

  /**
   * @brief CAS 认领 required 字节
   * @return 记录起始下标，或 INSUFFICIENT_CAPACITY
   */
  std::int32_t claim_capacity(std::int32_t required) noexcept {
    using namespace record_descriptor;

    std::int64_t head;
    std::int64_t tail;
    std::int32_t tail_index;
    std::int32_t padding;

    do {
      head = buffer_.get_int64_volatile(head_counter_index_);
      tail = buffer_.get_int64_volatile(tail_counter_index_);

      const std::int32_t available =
          capacity_ - static_cast<std::int32_t>(tail - head);
      if (required > available) {
        return INSUFFICIENT_CAPACITY;
      }

      padding = 0;
      tail_index = static_cast<std::int32_t>(tail) & mask_;
      const std::int32_t to_buffer_end = capacity_ - tail_index;

      if (required > to_buffer_end) {
        // 尾部放不下，需要回绕到起点：起点到 head 之间必须有足够空间
        const std::int32_t head_index = static_cast<std::int32_t>(head) & mask_;
        if (required > head_index) {
          return INSUFFICIENT_CAPACITY;
        }
        padding = to_buffer_end;
      }
    } while (!buffer_.compare_and_set_int64(tail_counter_index_, tail,
                                            tail + required + padding));

    if (padding != 0) {
      buffer_.put_int32(type_offset(tail_index), PADDING_MSG_TYPE_ID);
      buffer_.put_int32_ordered(length_offset(tail_index), padding);
      tail_index = 0;
    }

    return tail_index;
  }

  AtomicBuffer buffer_;
  std::int32_t capacity_;
  std::int32_t mask_;
  std::int32_t max_msg_length_;
  std::int32_t tail_counter_index_;
  std::int32_t head_counter_index_;
  std::int32_t correlation_counter_index_;
};

} // namespace mdr
