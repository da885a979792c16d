#pragma once

#include "mdr/log.hpp"
#include "mdr/types.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mdr {

class FlowControlStrategy;

namespace config {
constexpr std::size_t CACHE_LINE_SIZE = detail::CACHE_LINE_SIZE;

// 客户端 <-> Driver 的命令环形缓冲区容量 (不含 trailer)
constexpr std::int32_t COMMAND_BUFFER_SIZE = 64 * 1024;
// 单条消息上限为容量的 1/8：至少 512 字节，足够容纳错误应答头与常见的请求回显
constexpr std::int32_t COMMAND_BUFFER_SIZE_MIN = 4 * 1024;
// Conductor -> Sender 交接队列槽位数
constexpr std::size_t SENDER_QUEUE_CAPACITY = 1024;

constexpr std::int32_t TERM_BUFFER_SIZE = 64 * 1024;
constexpr std::int32_t TERM_BUFFER_SIZE_MIN = 1024;
constexpr std::int32_t MTU_LENGTH = 4096;

constexpr std::chrono::nanoseconds HEARTBEAT_TIMEOUT =
    std::chrono::milliseconds(100);
constexpr std::chrono::nanoseconds TICK_DURATION =
    std::chrono::milliseconds(10);
constexpr std::int32_t TICKS_PER_WHEEL = 1024;

constexpr std::string_view DEFAULT_DIR = "/dev/shm/mdr";
} // namespace config

/// 纳秒时钟。测试中替换为可控时钟。
using NanoClock = std::function<std::int64_t()>;

inline std::int64_t system_nano_time() noexcept {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

/**
 * @brief Media Driver 运行配置
 *
 * 全部字段都有默认值，可用 designated initializer 覆盖：
 * @code
 * DriverConfig cfg{.dir = "/tmp/mdr", .term_buffer_size = 128 * 1024};
 * @endcode
 */
struct DriverConfig {
  /// 根目录：命令缓冲区位于 `<dir>/conductor`，Term Log 位于 `<dir>/data`
  std::string dir = std::string(config::DEFAULT_DIR);

  std::int32_t command_buffer_size = config::COMMAND_BUFFER_SIZE;
  std::int32_t term_buffer_size = config::TERM_BUFFER_SIZE;
  std::int32_t mtu = config::MTU_LENGTH;

  std::chrono::nanoseconds heartbeat_timeout = config::HEARTBEAT_TIMEOUT;
  std::chrono::nanoseconds tick_duration = config::TICK_DURATION;
  std::int32_t ticks_per_wheel = config::TICKS_PER_WHEEL;

  /// 为空时使用 UnboundedFlowControl
  std::function<std::unique_ptr<FlowControlStrategy>()> flow_control_supplier;

  /// 为空时使用 steady_clock
  NanoClock nano_clock;

  log::Level log_level = log::Level::Info;

  // 线程绑定，-1 表示不绑定
  int conductor_cpu = -1;
  int sender_cpu = -1;
  int numa_node = -1;

  [[nodiscard]] std::string admin_dir() const { return dir + "/conductor"; }
  [[nodiscard]] std::string data_dir() const { return dir + "/data"; }

  [[nodiscard]] NanoClock clock() const {
    return nano_clock ? nano_clock : NanoClock(&system_nano_time);
  }

  /**
   * @brief 校验配置，非法值抛出 std::invalid_argument
   */
  void validate() const {
    if (!is_power_of_two(command_buffer_size) ||
        command_buffer_size < config::COMMAND_BUFFER_SIZE_MIN) {
      throw std::invalid_argument(
          "command_buffer_size must be a power of 2 and >= 4096");
    }
    if (!is_power_of_two(term_buffer_size) ||
        term_buffer_size < config::TERM_BUFFER_SIZE_MIN) {
      throw std::invalid_argument(
          "term_buffer_size must be a power of 2 and >= 1024");
    }
    if (mtu < 64 || mtu > term_buffer_size / 2 || (mtu & 7) != 0) {
      throw std::invalid_argument(
          "mtu must be 8-byte aligned, >= 64 and <= term_buffer_size / 2");
    }
    if (!is_power_of_two(ticks_per_wheel)) {
      throw std::invalid_argument("ticks_per_wheel must be a power of 2");
    }
    if (tick_duration.count() <= 0 || heartbeat_timeout.count() <= 0) {
      throw std::invalid_argument("durations must be positive");
    }
  }

  /**
   * @brief 从环境变量覆盖默认值
   *
   * MDR_DIR, MDR_TERM_BUFFER_SIZE, MDR_MTU, MDR_HEARTBEAT_TIMEOUT_MS, MDR_LOG_LEVEL
   */
  static DriverConfig from_env() {
    DriverConfig cfg;
    if (const char *v = std::getenv("MDR_DIR"))
      cfg.dir = v;
    if (auto v = env_int("MDR_TERM_BUFFER_SIZE"))
      cfg.term_buffer_size = static_cast<std::int32_t>(*v);
    if (auto v = env_int("MDR_MTU"))
      cfg.mtu = static_cast<std::int32_t>(*v);
    if (auto v = env_int("MDR_HEARTBEAT_TIMEOUT_MS"))
      cfg.heartbeat_timeout = std::chrono::milliseconds(*v);
    if (const char *v = std::getenv("MDR_LOG_LEVEL")) {
      auto lvl = log::parse_level(v);
      if (!lvl)
        throw std::invalid_argument(std::string("invalid MDR_LOG_LEVEL: ") + v);
      cfg.log_level = *lvl;
    }
    return cfg;
  }

private:
  static std::optional<std::int64_t> env_int(const char *name) {
    const char *v = std::getenv(name);
    if (!v)
      return std::nullopt;

    std::string_view sv(v);
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
      throw std::invalid_argument(std::string("invalid integer in ") + name +
                                  ": " + v);
    }
    return out;
  }
};

} // namespace mdr
