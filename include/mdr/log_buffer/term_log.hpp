#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/log_buffer/frame_descriptor.hpp"
#include "mdr/protocol/header_flyweight.hpp"
#include "mdr/types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mdr {

/**
 * @brief Term Log 区域布局
 *
 * [ term 0 | term 1 | term 2 | state 0 | state 1 | state 2 | meta ]
 *
 * state (128B, 每块独占两条 Cache Line):
 *   tail    i32 @0   <--- 只由 Appender 写 (Release)
 *   status  i32 @64  <--- CLEAN / IN_USE / NEEDS_CLEANING
 *   term_id i32 @68
 *
 * meta (256B):
 *   active_index    i32 @0   <--- 只由 Publication 写 (Release)
 *   initial_term_id i32 @64
 *   mtu             i32 @68
 *   default header  32B @128 (session_id / channel_id 预先填好的数据帧头)
 */
namespace term_log_descriptor {
constexpr std::int32_t PARTITION_COUNT = 3;

constexpr std::int32_t STATE_LENGTH = 128;
constexpr std::int32_t TAIL_OFFSET = 0;
constexpr std::int32_t STATUS_OFFSET = 64;
constexpr std::int32_t TERM_ID_OFFSET = 68;

constexpr std::int32_t META_LENGTH = 256;
constexpr std::int32_t ACTIVE_INDEX_OFFSET = 0;
constexpr std::int32_t INITIAL_TERM_ID_OFFSET = 64;
constexpr std::int32_t MTU_OFFSET = 68;
constexpr std::int32_t DEFAULT_HEADER_OFFSET = 128;

constexpr std::int32_t TRAILER_LENGTH =
    PARTITION_COUNT * STATE_LENGTH + META_LENGTH;

constexpr std::int32_t CLEAN = 0;
constexpr std::int32_t IN_USE = 1;
constexpr std::int32_t NEEDS_CLEANING = 2;

constexpr std::int32_t MIN_TERM_CAPACITY = 1024;

constexpr std::int64_t required_length(std::int32_t term_capacity) noexcept {
  return static_cast<std::int64_t>(term_capacity) * PARTITION_COUNT +
         TRAILER_LENGTH;
}

constexpr std::int32_t next_index(std::int32_t index) noexcept {
  return (index + 1) % PARTITION_COUNT;
}
} // namespace term_log_descriptor

/**
 * @brief 一个 (Destination, Channel, Session) 的出站帧缓冲区视图
 *
 * 不拥有内存，通常架在 MappedRegion 上。Driver 与客户端各自映射同一文件，
 * 各自构造 TermLog 视图。
 */
class TermLog {
public:
  TermLog() = default;

  /**
   * @throws std::invalid_argument 区域长度不是 3 * 2^n + TRAILER_LENGTH
   */
  explicit TermLog(const AtomicBuffer &region) : region_(region) {
    using namespace term_log_descriptor;
    const std::int64_t terms_length =
        static_cast<std::int64_t>(region.capacity()) - TRAILER_LENGTH;
    term_capacity_ = static_cast<std::int32_t>(terms_length / PARTITION_COUNT);

    if (terms_length <= 0 || terms_length % PARTITION_COUNT != 0 ||
        !is_power_of_two(term_capacity_) || term_capacity_ < MIN_TERM_CAPACITY) {
      throw std::invalid_argument("invalid term log length: " +
                                  std::to_string(region.capacity()));
    }
  }

  /**
   * @brief 初始化新建的区域 (Driver 端，区域内容全部为 0)
   *
   * term 0 置为 IN_USE，其余为 CLEAN。
   */
  void initialise(std::int32_t initial_term_id, std::int32_t mtu,
                  std::uint64_t session_id, std::uint64_t channel_id) {
    using namespace term_log_descriptor;
    if (mtu < DataHeaderFlyweight::HEADER_LENGTH + frame_descriptor::FRAME_ALIGNMENT ||
        (mtu & (frame_descriptor::FRAME_ALIGNMENT - 1)) != 0 ||
        mtu > term_capacity_) {
      throw std::invalid_argument("invalid mtu: " + std::to_string(mtu));
    }

    region_.put_int32(meta_offset() + INITIAL_TERM_ID_OFFSET, initial_term_id);
    region_.put_int32(meta_offset() + MTU_OFFSET, mtu);

    DataHeaderFlyweight header(region_, meta_offset() + DEFAULT_HEADER_OFFSET);
    header.version(HeaderFlyweight::CURRENT_VERSION);
    header.flags(DataHeaderFlyweight::BEGIN_AND_END_FLAGS);
    header.header_type(HeaderFlyweight::HDR_TYPE_DATA);
    header.session_id(session_id);
    header.channel_id(channel_id);

    for (std::int32_t i = 0; i < PARTITION_COUNT; ++i) {
      region_.put_int32(state_offset(i) + TERM_ID_OFFSET, initial_term_id + i);
      region_.put_int32_ordered(state_offset(i) + TAIL_OFFSET, 0);
      region_.put_int32_ordered(state_offset(i) + STATUS_OFFSET,
                                i == 0 ? IN_USE : CLEAN);
    }
    region_.put_int32_ordered(meta_offset() + ACTIVE_INDEX_OFFSET, 0);
  }

  [[nodiscard]] const AtomicBuffer &region() const noexcept { return region_; }
  [[nodiscard]] std::int32_t term_capacity() const noexcept {
    return term_capacity_;
  }

  [[nodiscard]] AtomicBuffer term(std::int32_t index) const noexcept {
    return AtomicBuffer(region_.data() + index * term_capacity_, term_capacity_);
  }

  // ===========================================================================
  // 分区状态
  // ===========================================================================

  [[nodiscard]] std::int32_t tail(std::int32_t index) const noexcept {
    return region_.get_int32_volatile(state_offset(index) +
                                      term_log_descriptor::TAIL_OFFSET);
  }
  void tail_ordered(std::int32_t index, std::int32_t value) noexcept {
    region_.put_int32_ordered(
        state_offset(index) + term_log_descriptor::TAIL_OFFSET, value);
  }

  [[nodiscard]] std::int32_t status(std::int32_t index) const noexcept {
    return region_.get_int32_volatile(state_offset(index) +
                                      term_log_descriptor::STATUS_OFFSET);
  }
  void status_ordered(std::int32_t index, std::int32_t value) noexcept {
    region_.put_int32_ordered(
        state_offset(index) + term_log_descriptor::STATUS_OFFSET, value);
  }

  [[nodiscard]] std::int32_t term_id(std::int32_t index) const noexcept {
    return region_.get_int32_volatile(state_offset(index) +
                                      term_log_descriptor::TERM_ID_OFFSET);
  }
  void term_id_ordered(std::int32_t index, std::int32_t value) noexcept {
    region_.put_int32_ordered(
        state_offset(index) + term_log_descriptor::TERM_ID_OFFSET, value);
  }

  // ===========================================================================
  // 元数据
  // ===========================================================================

  [[nodiscard]] std::int32_t active_index() const noexcept {
    return region_.get_int32_volatile(meta_offset() +
                                      term_log_descriptor::ACTIVE_INDEX_OFFSET);
  }
  void active_index_ordered(std::int32_t index) noexcept {
    region_.put_int32_ordered(
        meta_offset() + term_log_descriptor::ACTIVE_INDEX_OFFSET, index);
  }

  [[nodiscard]] std::int32_t initial_term_id() const noexcept {
    return region_.get_int32(meta_offset() +
                             term_log_descriptor::INITIAL_TERM_ID_OFFSET);
  }
  [[nodiscard]] std::int32_t mtu() const noexcept {
    return region_.get_int32(meta_offset() + term_log_descriptor::MTU_OFFSET);
  }

  [[nodiscard]] AtomicBuffer default_header() const noexcept {
    return AtomicBuffer(region_.data() + meta_offset() +
                            term_log_descriptor::DEFAULT_HEADER_OFFSET,
                        DataHeaderFlyweight::HEADER_LENGTH);
  }

  [[nodiscard]] std::uint64_t session_id() const noexcept {
    return DataHeaderFlyweight(default_header(), 0).session_id();
  }
  [[nodiscard]] std::uint64_t channel_id() const noexcept {
    return DataHeaderFlyweight(default_header(), 0).channel_id();
  }

  /**
   * @brief 清理一个已被完全消费的 term (Sender 端)
   *
   * 清零数据区后以 Release 语义置为 CLEAN，Publication 看到 CLEAN 后
   * 才会轮转进入该 term。tail 由 Publication 在轮转时重置。
   */
  void clean(std::int32_t index) noexcept {
    status_ordered(index, term_log_descriptor::NEEDS_CLEANING);
    term(index).set_memory(0, term_capacity_, 0);
    status_ordered(index, term_log_descriptor::CLEAN);
  }

private:
  [[nodiscard]] std::int32_t state_offset(std::int32_t index) const noexcept {
    return term_capacity_ * term_log_descriptor::PARTITION_COUNT +
           index * term_log_descriptor::STATE_LENGTH;
  }
  [[nodiscard]] std::int32_t meta_offset() const noexcept {
    return term_capacity_ * term_log_descriptor::PARTITION_COUNT +
           term_log_descriptor::PARTITION_COUNT * term_log_descriptor::STATE_LENGTH;
  }

  AtomicBuffer region_;
  std::int32_t term_capacity_ = 0;
};

} // namespace mdr
