#pragma once

#include "mdr/types.hpp"
#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace mdr {

/**
 * @brief 哈希时间轮 (Hashed Timer Wheel)
 *
 * 由驱动线程每轮调用 advance(now) 推进，不为每个定时器创建线程。
 *
 * - 槽位数 ticks_per_wheel (2 的幂)，每槽跨度 tick_duration。
 * - 定时器按 `deadline_tick & mask` 放入槽位，槽内为插入顺序链表。
 * - schedule / cancel: O(1)；advance: O(到期数 + 经过的 tick 数)。
 * - 同一槽位内按 deadline 升序触发，deadline 相同按插入顺序。
 *
 * 条目存放在对象池中，TimerId 携带代数 (generation)：条目触发或取消后
 * 代数递增，过期的 TimerId 再 cancel 只会返回 false，不会误伤复用的条目。
 *
 * @note 非线程安全，只能由拥有它的工作线程使用。
 */
class TimerWheel {
public:
  struct TimerId {
    std::uint32_t index = std::numeric_limits<std::uint32_t>::max();
    std::uint32_t generation = 0;

    [[nodiscard]] bool is_valid() const noexcept {
      return index != std::numeric_limits<std::uint32_t>::max();
    }
    bool operator==(const TimerId &) const = default;
  };

  TimerWheel(std::chrono::nanoseconds tick_duration,
             std::int32_t ticks_per_wheel, std::int64_t start_time_ns = 0)
      : tick_ns_(tick_duration.count()), mask_(ticks_per_wheel - 1),
        start_time_ns_(start_time_ns),
        slot_head_(static_cast<std::size_t>(ticks_per_wheel), NIL),
        slot_tail_(static_cast<std::size_t>(ticks_per_wheel), NIL) {
    if (tick_ns_ <= 0) {
      throw std::invalid_argument("tick duration must be positive");
    }
    if (!is_power_of_two(ticks_per_wheel)) {
      throw std::invalid_argument("ticks_per_wheel must be a power of 2: " +
                                  std::to_string(ticks_per_wheel));
    }
  }

  /**
   * @brief 调度一个定时器
   *
   * @param deadline_ns 绝对时间 (与 advance 使用同一时钟)，已过期的 deadline
   * 放入当前 tick，在下一次 advance 时触发
   * @param token 触发时原样交给回调 (通常是会话句柄)
   */
  [[nodiscard]] TimerId schedule(std::int64_t deadline_ns, std::uint64_t token) {
    const std::int64_t deadline_tick =
        std::max(tick_of(deadline_ns), current_tick_);

    std::uint32_t index;
    if (!free_.empty()) {
      index = free_.back();
      free_.pop_back();
    } else {
      index = static_cast<std::uint32_t>(entries_.size());
      entries_.emplace_back();
    }

    Entry &e = entries_[index];
    e.deadline = deadline_ns;
    e.deadline_tick = deadline_tick;
    e.token = token;
    e.active = true;
    link(index, static_cast<std::int32_t>(deadline_tick & mask_));

    ++size_;
    return TimerId{index, e.generation};
  }

  /**
   * @brief 取消定时器
   * @return true 取消成功; false 已触发、已取消或 id 无效 (no-op)
   */
  bool cancel(TimerId id) noexcept {
    if (!is_active(id)) {
      return false;
    }
    release(id.index);
    return true;
  }

  [[nodiscard]] bool is_active(TimerId id) const noexcept {
    return id.index < entries_.size() && entries_[id.index].active &&
           entries_[id.index].generation == id.generation;
  }

  /**
   * @brief 推进时间轮到 now，触发所有 deadline <= now 的定时器
   *
   * 回调签名: void(std::uint64_t token, TimerId id)。回调内可以 schedule
   * 新定时器或 cancel 其它定时器。
   *
   * @return 本次触发的定时器数量
   */
  template <typename F>
    requires std::invocable<F, std::uint64_t, TimerId>
  int advance(std::int64_t now_ns, F &&on_expiry) {
    if (now_ns < start_time_ns_) {
      return 0;
    }

    const std::int64_t target_tick = tick_of(now_ns);
    int expired = 0;

    for (;;) {
      const auto slot = static_cast<std::int32_t>(current_tick_ & mask_);

      // 回调可能向当前 tick 追加已到期的定时器，重复扫描直到没有到期条目
      for (;;) {
        due_.clear();
        for (std::int32_t i = slot_head_[slot]; i != NIL; i = entries_[i].next) {
          const Entry &e = entries_[i];
          if (e.deadline_tick == current_tick_ && e.deadline <= now_ns) {
            due_.push_back(static_cast<std::uint32_t>(i));
          }
        }
        if (due_.empty()) {
          break;
        }

        // 槽内链表为插入顺序，stable_sort 保证 deadline 相同按插入顺序
        std::stable_sort(due_.begin(), due_.end(),
                         [this](std::uint32_t a, std::uint32_t b) {
                           return entries_[a].deadline < entries_[b].deadline;
                         });

        firing_.assign(due_.begin(), due_.end());
        for (std::uint32_t index : firing_) {
          // 前面的回调可能已经取消了它
          if (!entries_[index].active) {
            continue;
          }
          const TimerId id{index, entries_[index].generation};
          const std::uint64_t token = entries_[index].token;
          release(index);
          ++expired;
          std::invoke(on_expiry, token, id);
        }
      }

      if (current_tick_ >= target_tick) {
        break;
      }
      ++current_tick_;
    }

    return expired;
  }

  // ===========================================================================
  // 状态查询
  // ===========================================================================

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::int32_t ticks_per_wheel() const noexcept {
    return mask_ + 1;
  }
  [[nodiscard]] std::chrono::nanoseconds tick_duration() const noexcept {
    return std::chrono::nanoseconds(tick_ns_);
  }
  /// 当前 tick 的起始时间
  [[nodiscard]] std::int64_t current_tick_time() const noexcept {
    return start_time_ns_ + current_tick_ * tick_ns_;
  }

private:
  static constexpr std::int32_t NIL = -1;

  struct Entry {
    std::int64_t deadline = 0;
    std::int64_t deadline_tick = 0;
    std::uint64_t token = 0;
    std::uint32_t generation = 0;
    std::int32_t slot = NIL;
    std::int32_t prev = NIL;
    std::int32_t next = NIL;
    bool active = false;
  };

  [[nodiscard]] std::int64_t tick_of(std::int64_t time_ns) const noexcept {
    if (time_ns <= start_time_ns_) {
      return 0;
    }
    return (time_ns - start_time_ns_) / tick_ns_;
  }

  void link(std::uint32_t index, std::int32_t slot) noexcept {
    Entry &e = entries_[index];
    e.slot = slot;
    e.next = NIL;
    e.prev = slot_tail_[slot];
    if (e.prev != NIL) {
      entries_[e.prev].next = static_cast<std::int32_t>(index);
    } else {
      slot_head_[slot] = static_cast<std::int32_t>(index);
    }
    slot_tail_[slot] = static_cast<std::int32_t>(index);
  }

  void release(std::uint32_t index) {
    Entry &e = entries_[index];
    if (e.prev != NIL) {
      entries_[e.prev].next = e.next;
    } else {
      slot_head_[e.slot] = e.next;
    }
    if (e.next != NIL) {
      entries_[e.next].prev = e.prev;
    } else {
      slot_tail_[e.slot] = e.prev;
    }

    e.active = false;
    e.prev = e.next = e.slot = NIL;
    ++e.generation;
    --size_;
    free_.push_back(index);
  }

  std::int64_t tick_ns_;
  std::int32_t mask_;
  std::int64_t start_time_ns_;
  std::int64_t current_tick_ = 0;
  std::size_t size_ = 0;

  std::vector<Entry> entries_;
  std::vector<std::uint32_t> free_;
  std::vector<std::int32_t> slot_head_;
  std::vector<std::int32_t> slot_tail_;
  std::vector<std::uint32_t> due_;
  std::vector<std::uint32_t> firing_;
};

} // namespace mdr
