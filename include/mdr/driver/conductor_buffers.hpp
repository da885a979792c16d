#pragma once

#include "mdr/core/ring_buffer.hpp"
#include "mdr/core/shared_memory.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mdr {

/**
 * @brief 客户端与 Driver 之间的两条命令通道
 *
 * `<admin_dir>/to-driver`: 客户端 (多生产者) -> Conductor (单消费者)
 * `<admin_dir>/to-client`: Conductor -> 客户端
 *
 * Driver 以 create 模式创建两个文件 (命令缓冲区容量 + trailer)，
 * 客户端以 open 模式映射已有文件。
 */
class ConductorBuffers {
public:
  static constexpr std::string_view TO_DRIVER_FILE = "to-driver";
  static constexpr std::string_view TO_CLIENT_FILE = "to-client";

  /// Driver 端：创建并映射
  ConductorBuffers(const std::string &admin_dir, std::int32_t buffer_size)
      : to_driver_region_(MappedRegion::create(path(admin_dir, TO_DRIVER_FILE),
                                               region_size(buffer_size))),
        to_client_region_(MappedRegion::create(path(admin_dir, TO_CLIENT_FILE),
                                               region_size(buffer_size))),
        to_driver_(to_driver_region_.buffer()),
        to_client_(to_client_region_.buffer()) {}

  /// 客户端：映射 Driver 已创建的文件
  explicit ConductorBuffers(const std::string &admin_dir)
      : to_driver_region_(MappedRegion::open(path(admin_dir, TO_DRIVER_FILE))),
        to_client_region_(MappedRegion::open(path(admin_dir, TO_CLIENT_FILE))),
        to_driver_(to_driver_region_.buffer()),
        to_client_(to_client_region_.buffer()) {}

  ConductorBuffers(const ConductorBuffers &) = delete;
  ConductorBuffers &operator=(const ConductorBuffers &) = delete;

  [[nodiscard]] ManyToOneRingBuffer &to_driver() noexcept { return to_driver_; }
  [[nodiscard]] ManyToOneRingBuffer &to_client() noexcept { return to_client_; }

  [[nodiscard]] const std::string &to_driver_path() const noexcept {
    return to_driver_region_.path();
  }
  [[nodiscard]] const std::string &to_client_path() const noexcept {
    return to_client_region_.path();
  }

private:
  static std::string path(const std::string &dir, std::string_view file) {
    return dir + "/" + std::string(file);
  }

  static std::size_t region_size(std::int32_t buffer_size) {
    return static_cast<std::size_t>(buffer_size) +
           ring_buffer_descriptor::TRAILER_LENGTH;
  }

  MappedRegion to_driver_region_;
  MappedRegion to_client_region_;
  ManyToOneRingBuffer to_driver_;
  ManyToOneRingBuffer to_client_;
};

} // namespace mdr
