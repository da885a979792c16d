#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/log_buffer/frame_descriptor.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>

namespace mdr {

/**
 * @brief 单个 term 的已提交帧扫描器
 *
 * frames(from) 返回惰性的有限区间：从 from 开始逐帧读取 frame_length
 * (Acquire)，遇到未提交位置 (0) 或 term 末尾即结束。PAD 帧同样产出，
 * 由调用方根据 type 跳过，无需读取负载。
 *
 * @code
 * for (const FrameDescriptor &f : scanner.frames(sent_offset)) {
 *   if (!f.is_padding()) transmit(f);
 *   sent_offset = f.term_offset + f.aligned_length();
 * }
 * @endcode
 */
class LogScanner {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = FrameDescriptor;
    using difference_type = std::ptrdiff_t;
    using reference = const FrameDescriptor &;
    using pointer = const FrameDescriptor *;

    Iterator() = default;
    Iterator(const AtomicBuffer &term, std::int32_t offset) noexcept
        : term_(term) {
      load(offset);
    }

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    Iterator &operator++() noexcept {
      load(current_.term_offset + current_.aligned_length());
      return *this;
    }
    void operator++(int) noexcept { ++*this; }

    bool operator==(std::default_sentinel_t) const noexcept { return done_; }

  private:
    void load(std::int32_t offset) noexcept {
      const std::int32_t capacity = term_.capacity();
      if (offset < 0 || offset + frame_descriptor::BASE_HEADER_LENGTH > capacity) {
        done_ = true;
        return;
      }

      const std::int32_t length =
          term_.get_int32_volatile(frame_descriptor::length_offset(offset));
      // 未提交，或帧长越过 term 末尾 (损坏)
      if (length <= 0 || length > capacity - offset) {
        done_ = true;
        return;
      }

      current_.term_offset = offset;
      current_.frame_length = length;
      current_.type = term_.get_uint16(frame_descriptor::type_offset(offset));
      current_.flags = term_.get_uint8(frame_descriptor::flags_offset(offset));
      done_ = false;
    }

    AtomicBuffer term_;
    FrameDescriptor current_;
    bool done_ = true;
  };

  class FrameRange {
  public:
    FrameRange(const AtomicBuffer &term, std::int32_t from) noexcept
        : term_(term), from_(from) {}

    [[nodiscard]] Iterator begin() const noexcept { return {term_, from_}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

  private:
    AtomicBuffer term_;
    std::int32_t from_;
  };

  LogScanner() = default;
  explicit LogScanner(const AtomicBuffer &term) noexcept : term_(term) {}

  [[nodiscard]] FrameRange frames(std::int32_t from_offset) const noexcept {
    return {term_, from_offset};
  }

  [[nodiscard]] std::int32_t capacity() const noexcept {
    return term_.capacity();
  }
  [[nodiscard]] const AtomicBuffer &term() const noexcept { return term_; }

private:
  AtomicBuffer term_;
};

} // namespace mdr
