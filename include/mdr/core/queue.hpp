#pragma once

#include "mdr/platform.hpp"
#include "mdr/types.hpp"
#include <array>
#include <atomic>
#include <bit>
#include <climits>
#include <functional>
#include <optional>
#include <utility>

namespace mdr {

using namespace mdr::detail;

/**
 * @brief 单生产者-单消费者 (SPSC) 无锁有界队列
 *
 * 用于同一进程内工作线程之间的交接 (例如 Conductor -> Sender)。
 * 元素以移动语义进出槽位，独占所有权随元素一起转移，交接中不共享任何引用。
 *
 * @section 特性
 * 1. Shadow Indexing: 生产者维护本地 `shadow_head_`，消费者维护本地
 * `shadow_tail_`，仅在缓冲区状态看似“满”或“空”时才同步全局原子索引。
 * 2. Cache Friendly: 生产者与消费者热点数据分别独占 Cache Line。
 *
 * @tparam T 数据类型，必须满足 HandoffData。
 * @tparam Capacity 缓冲区容量，必须是 2 的幂。
 */
template <typename T, std::size_t Capacity>
  requires HandoffData<T>
class BoundedQueue {
  static_assert(std::has_single_bit(Capacity), "Capacity must be power of 2");
  static constexpr std::size_t mask_ = Capacity - 1;

private:
  struct alignas(CACHE_LINE_SIZE) ConsumerLine {
    /// 全局读取索引 (Head Pointer)
    std::atomic<std::size_t> head_{0};
    /// 上一次看到的 tail_，减少对 ProducerLine 的跨核访问
    std::size_t shadow_tail_{0};
  };

  struct alignas(CACHE_LINE_SIZE) ProducerLine {
    /// 全局写入索引 (Tail Pointer)
    std::atomic<std::size_t> tail_{0};
    /// 上一次看到的 head_
    std::size_t shadow_head_{0};
  };

  ConsumerLine consumer_;
  ProducerLine producer_;

  alignas(CACHE_LINE_SIZE) std::array<T, Capacity> buffer_{};

public:
  BoundedQueue() noexcept = default;

  BoundedQueue(const BoundedQueue &) = delete;
  BoundedQueue &operator=(const BoundedQueue &) = delete;

  // ===========================================================================
  // Producer
  // ===========================================================================

  /**
   * @brief 尝试零拷贝写入 (Visitor 模式)
   * @return true 写入成功; false 队列已满
   */
  template <typename F>
    requires std::invocable<F, T &>
  [[nodiscard]] bool try_produce(F &&writer) noexcept {
    const std::size_t tail = producer_.tail_.load(std::memory_order_relaxed);

    // shadow_head_ <= 实际 head_，基于旧快照有空间则实际一定有空间
    if (tail - producer_.shadow_head_ >= Capacity) {
      const std::size_t head = consumer_.head_.load(std::memory_order_acquire);
      producer_.shadow_head_ = head;

      if (tail - head >= Capacity) {
        return false; // Full
      }
    }

    std::invoke(std::forward<F>(writer), buffer_[tail & mask_]);

    producer_.tail_.store(tail + 1, std::memory_order_release);
    return true;
  }

  /// 队列满时返回 false，此时 data 不会被移动
  template <typename U>
    requires std::is_assignable_v<T &, U>
  [[nodiscard]] bool try_push(U &&data) noexcept {
    return try_produce([&](T &slot) { slot = std::forward<U>(data); });
  }

  // ===========================================================================
  // Consumer
  // ===========================================================================

  /**
   * @brief 尝试零拷贝消费一个元素
   * @return true 成功; false 队列为空
   */
  template <typename F>
    requires std::invocable<F, T &>
  [[nodiscard]] bool try_consume(F &&visitor) noexcept(
      std::is_nothrow_invocable_v<F, T &>) {
    const std::size_t head = consumer_.head_.load(std::memory_order_relaxed);

    if (consumer_.shadow_tail_ == head) {
      const std::size_t tail = producer_.tail_.load(std::memory_order_acquire);
      consumer_.shadow_tail_ = tail;

      if (head == tail) {
        return false; // Empty
      }
    }

    // 先移出并发布 head 再回调：回调抛异常时该元素不会被重复消费
    T item = std::move(buffer_[head & mask_]);
    consumer_.head_.store(head + 1, std::memory_order_release);
    std::invoke(std::forward<F>(visitor), item);
    return true;
  }

  [[nodiscard]] std::optional<T> try_pop() noexcept {
    std::optional<T> res;
    (void)try_consume([&](T &data) { res.emplace(std::move(data)); });
    return res;
  }

  /**
   * @brief 消费当前所有可见元素 (最多 limit 个)
   * @return 消费的元素个数
   */
  template <typename F>
    requires std::invocable<F, T &>
  int drain(F &&visitor, int limit = INT_MAX) {
    int count = 0;
    while (count < limit && try_consume(visitor)) {
      ++count;
    }
    return count;
  }

  // ===========================================================================
  // 状态查询
  // ===========================================================================

  /// 当前队列中的元素数量 (估计值)
  [[nodiscard]] std::size_t size() const noexcept {
    auto tail = producer_.tail_.load(std::memory_order_relaxed);
    auto head = consumer_.head_.load(std::memory_order_relaxed);
    return tail - head;
  }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }
  [[nodiscard]] bool full() const noexcept { return size() >= Capacity; }
  [[nodiscard]] static constexpr std::size_t capacity() noexcept {
    return Capacity;
  }
};

} // namespace mdr
