#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace mdr {

namespace detail {
constexpr std::size_t CACHE_LINE_SIZE = 64;
} // namespace detail

// 线上 (wire) 与共享内存统一使用小端序，Flyweight 直接按本机字节序读写
static_assert(std::endian::native == std::endian::little,
              "mdr wire format requires a little-endian host");

/**
 * @brief [数据约束] 线程间交接队列的元素 Concept
 *
 * 通过 SPSC 队列传递的元素 T 必须满足：
 * 1. **DefaultConstructible**: 队列槽位需要预先构造。
 * 2. **NothrowMovable**: 生产者移入槽位、消费者移出槽位，可以携带
 *    unique_ptr 之类的独占所有权。
 */
template <typename T>
concept HandoffData = std::is_default_constructible_v<T> &&
                      std::is_nothrow_move_constructible_v<T> &&
                      std::is_nothrow_move_assignable_v<T>;

// 检查原子操作在共享内存中是否免锁 (Linux x86_64 通常是 true)
// 如果不是免锁的，原子变量可能使用进程本地的哈希表锁，导致无法跨进程同步
template <typename T>
concept LockFreeAtomic = std::atomic<T>::is_always_lock_free;

/// 运行期对齐，alignment 必须是 2 的幂
constexpr std::int32_t align(std::int32_t value, std::int32_t alignment) noexcept {
  return (value + (alignment - 1)) & ~(alignment - 1);
}

constexpr bool is_power_of_two(std::int64_t value) noexcept {
  return value > 0 && std::has_single_bit(static_cast<std::uint64_t>(value));
}

/**
 * @brief 解码失败 (控制消息或帧格式非法)
 *
 * 只影响单条消息：在组件边界被吸收，丢弃该消息后继续处理。
 */
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace mdr
