#pragma once

#include "mdr/types.hpp"
#include <atomic>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mdr {

// 跨进程共享的计数器必须是免锁原子
static_assert(LockFreeAtomic<std::int32_t> && LockFreeAtomic<std::int64_t>);

/**
 * @brief 原始字节区域上的类型化访问视图 (不拥有内存)
 *
 * 共享内存映射、Term Log、环形缓冲区、Flyweight 编解码都建立在它之上。
 *
 * - 普通读写 (`get_*` / `put_*`): memcpy 语义，无序。
 * - `*_volatile`: acquire 读。
 * - `*_ordered`: release 写。
 * - CAS / fetch_add: 基于 std::atomic_ref，要求地址按类型自然对齐。
 *
 * 字节序为本机小端 (见 types.hpp 中的 static_assert)。
 */
class AtomicBuffer {
public:
  AtomicBuffer() noexcept = default;

  AtomicBuffer(std::uint8_t *addr, std::int32_t capacity) noexcept
      : addr_(addr), capacity_(capacity) {}

  explicit AtomicBuffer(std::span<std::uint8_t> bytes) noexcept
      : addr_(bytes.data()), capacity_(static_cast<std::int32_t>(bytes.size())) {}

  void wrap(std::uint8_t *addr, std::int32_t capacity) noexcept {
    addr_ = addr;
    capacity_ = capacity;
  }

  [[nodiscard]] std::uint8_t *data() const noexcept { return addr_; }
  [[nodiscard]] std::int32_t capacity() const noexcept { return capacity_; }

  /// 取子视图 [index, index + length)
  [[nodiscard]] AtomicBuffer view(std::int32_t index, std::int32_t length) const {
    check_bounds(index, length);
    return AtomicBuffer(addr_ + index, length);
  }

  void check_bounds(std::int32_t index, std::int32_t length) const {
    if (index < 0 || length < 0 ||
        static_cast<std::int64_t>(index) + length > capacity_) {
      throw std::out_of_range("AtomicBuffer index " + std::to_string(index) +
                              " length " + std::to_string(length) +
                              " exceeds capacity " + std::to_string(capacity_));
    }
  }

  // ===========================================================================
  // 普通读写
  // ===========================================================================

  template <typename T> [[nodiscard]] T get(std::int32_t index) const noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    T value;
    std::memcpy(&value, addr_ + index, sizeof(T));
    return value;
  }

  template <typename T> void put(std::int32_t index, T value) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    std::memcpy(addr_ + index, &value, sizeof(T));
  }

  [[nodiscard]] std::uint8_t get_uint8(std::int32_t index) const noexcept {
    return get<std::uint8_t>(index);
  }
  void put_uint8(std::int32_t index, std::uint8_t v) noexcept { put(index, v); }

  [[nodiscard]] std::uint16_t get_uint16(std::int32_t index) const noexcept {
    return get<std::uint16_t>(index);
  }
  void put_uint16(std::int32_t index, std::uint16_t v) noexcept { put(index, v); }

  [[nodiscard]] std::int32_t get_int32(std::int32_t index) const noexcept {
    return get<std::int32_t>(index);
  }
  void put_int32(std::int32_t index, std::int32_t v) noexcept { put(index, v); }

  [[nodiscard]] std::int64_t get_int64(std::int32_t index) const noexcept {
    return get<std::int64_t>(index);
  }
  void put_int64(std::int32_t index, std::int64_t v) noexcept { put(index, v); }

  [[nodiscard]] std::uint64_t get_uint64(std::int32_t index) const noexcept {
    return get<std::uint64_t>(index);
  }
  void put_uint64(std::int32_t index, std::uint64_t v) noexcept { put(index, v); }

  // ===========================================================================
  // 原子读写 (Acquire / Release)
  // ===========================================================================

  [[nodiscard]] std::int32_t get_int32_volatile(std::int32_t index) const noexcept {
    return ref<std::int32_t>(index).load(std::memory_order_acquire);
  }
  void put_int32_ordered(std::int32_t index, std::int32_t v) noexcept {
    ref<std::int32_t>(index).store(v, std::memory_order_release);
  }

  [[nodiscard]] std::int64_t get_int64_volatile(std::int32_t index) const noexcept {
    return ref<std::int64_t>(index).load(std::memory_order_acquire);
  }
  void put_int64_ordered(std::int32_t index, std::int64_t v) noexcept {
    ref<std::int64_t>(index).store(v, std::memory_order_release);
  }

  [[nodiscard]] bool compare_and_set_int64(std::int32_t index,
                                           std::int64_t expected,
                                           std::int64_t desired) noexcept {
    return ref<std::int64_t>(index).compare_exchange_strong(
        expected, desired, std::memory_order_acq_rel,
        std::memory_order_acquire);
  }

  std::int64_t get_and_add_int64(std::int32_t index, std::int64_t delta) noexcept {
    return ref<std::int64_t>(index).fetch_add(delta, std::memory_order_acq_rel);
  }

  std::int32_t get_and_add_int32(std::int32_t index, std::int32_t delta) noexcept {
    return ref<std::int32_t>(index).fetch_add(delta, std::memory_order_acq_rel);
  }

  // ===========================================================================
  // 块操作
  // ===========================================================================

  void put_bytes(std::int32_t index, const std::uint8_t *src,
                 std::int32_t length) noexcept {
    std::memcpy(addr_ + index, src, static_cast<std::size_t>(length));
  }

  void put_bytes(std::int32_t index, const AtomicBuffer &src,
                 std::int32_t src_index, std::int32_t length) noexcept {
    std::memmove(addr_ + index, src.addr_ + src_index,
                 static_cast<std::size_t>(length));
  }

  void get_bytes(std::int32_t index, std::uint8_t *dst,
                 std::int32_t length) const noexcept {
    std::memcpy(dst, addr_ + index, static_cast<std::size_t>(length));
  }

  void set_memory(std::int32_t index, std::int32_t length,
                  std::uint8_t value) noexcept {
    std::memset(addr_ + index, value, static_cast<std::size_t>(length));
  }

  // ===========================================================================
  // 字符串 (i32 长度前缀 + UTF-8)
  // ===========================================================================

  /// @return 写入的总字节数 (含长度前缀)
  std::int32_t put_string(std::int32_t index, std::string_view value) noexcept {
    auto length = static_cast<std::int32_t>(value.size());
    put_int32(index, length);
    std::memcpy(addr_ + index + sizeof(std::int32_t), value.data(), value.size());
    return static_cast<std::int32_t>(sizeof(std::int32_t)) + length;
  }

  /**
   * @brief 读取带长度前缀的字符串
   * @throws DecodeError 长度为负或越界
   */
  [[nodiscard]] std::string_view get_string_view(std::int32_t index) const {
    if (index < 0 ||
        static_cast<std::int64_t>(index) + sizeof(std::int32_t) >
            static_cast<std::uint64_t>(capacity_)) {
      throw DecodeError("string length prefix out of bounds at " +
                        std::to_string(index));
    }

    std::int32_t length = get_int32(index);
    std::int64_t end =
        static_cast<std::int64_t>(index) + sizeof(std::int32_t) + length;
    if (length < 0 || end > capacity_) {
      throw DecodeError("invalid string length " + std::to_string(length) +
                        " at " + std::to_string(index));
    }
    return {reinterpret_cast<const char *>(addr_ + index + sizeof(std::int32_t)),
            static_cast<std::size_t>(length)};
  }

  [[nodiscard]] std::string get_string(std::int32_t index) const {
    return std::string(get_string_view(index));
  }

private:
  template <typename T> std::atomic_ref<T> ref(std::int32_t index) const noexcept {
    return std::atomic_ref<T>(*reinterpret_cast<T *>(addr_ + index));
  }

  std::uint8_t *addr_ = nullptr;
  std::int32_t capacity_ = 0;
};

} // namespace mdr
