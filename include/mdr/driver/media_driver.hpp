#pragma once

#include "mdr/config.hpp"
#include "mdr/driver/buffer_management.hpp"
#include "mdr/driver/conductor.hpp"
#include "mdr/driver/conductor_buffers.hpp"
#include "mdr/driver/sender.hpp"
#include "mdr/log.hpp"
#include "mdr/platform.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace mdr {

/**
 * @brief Media Driver：组装所有组件并运行 Conductor / Sender 两个工作线程
 *
 * @code
 * MediaDriver driver(DriverConfig::from_env());
 * driver.start();
 * ...
 * driver.close();
 * @endcode
 *
 * 构造期间的资源错误 (命令文件、目录) 以 std::system_error 抛出。
 * 也可以不调用 start()，直接在当前线程驱动 conductor().process() 与
 * sender().process() (测试即如此)。
 */
class MediaDriver {
public:
  explicit MediaDriver(DriverConfig cfg)
      : cfg_((cfg.validate(), std::move(cfg))),
        buffers_(init_admin(cfg_), cfg_.command_buffer_size),
        buffer_management_(cfg_.data_dir(), cfg_.term_buffer_size),
        sender_queue_(std::make_unique<SenderQueue>()),
        sender_(cfg_, *sender_queue_),
        conductor_(cfg_, buffers_.to_driver(), buffers_.to_client(),
                   buffer_management_, *sender_queue_) {
    MDR_LOG_INFO("driver", "media driver ready dir={} term_buffer={} mtu={}",
                 cfg_.dir, cfg_.term_buffer_size, cfg_.mtu);
  }

  ~MediaDriver() { close(); }

  MediaDriver(const MediaDriver &) = delete;
  MediaDriver &operator=(const MediaDriver &) = delete;

  /// 启动 Conductor 与 Sender 线程
  void start() {
    conductor_thread_ = std::jthread([this](std::stop_token st) {
      run("conductor", cfg_.conductor_cpu, st, [this] { return conductor_.process(); });
    });
    sender_thread_ = std::jthread([this](std::stop_token st) {
      run("sender", cfg_.sender_cpu, st, [this] { return sender_.process(); });
    });
  }

  /// 停止线程并释放所有资源 (可重复调用)
  void close() {
    if (conductor_thread_.joinable()) {
      conductor_thread_.request_stop();
      conductor_thread_.join();
    }
    if (sender_thread_.joinable()) {
      sender_thread_.request_stop();
      sender_thread_.join();
    }
  }

  /// 任一工作线程因异常退出时为 true
  [[nodiscard]] bool has_failed() const noexcept {
    return failed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] const DriverConfig &config() const noexcept { return cfg_; }
  [[nodiscard]] ConductorBuffers &buffers() noexcept { return buffers_; }
  [[nodiscard]] Conductor &conductor() noexcept { return conductor_; }
  [[nodiscard]] Sender &sender() noexcept { return sender_; }

private:
  static std::string init_admin(const DriverConfig &cfg) {
    log::set_level(cfg.log_level);
    return cfg.admin_dir();
  }

  template <typename F>
  void run(std::string_view name, int cpu, std::stop_token st, F &&work) {
    try {
      if (cpu >= 0) {
        if (cfg_.numa_node >= 0) {
          bind_numa(cfg_.numa_node, cpu);
        } else {
          bind_cpu(cpu);
        }
      }

      MDR_LOG_INFO("driver", "{} thread started", name);
      BackoffIdleStrategy idle;
      while (!st.stop_requested()) {
        idle.idle(work());
      }
      MDR_LOG_INFO("driver", "{} thread stopped", name);
    } catch (const std::exception &e) {
      failed_.store(true, std::memory_order_release);
      MDR_LOG_ERROR("driver", "{} thread terminated: {}", name, e.what());
    }
  }

  DriverConfig cfg_;
  ConductorBuffers buffers_;
  MappedBufferManagement buffer_management_;
  std::unique_ptr<SenderQueue> sender_queue_;
  Sender sender_;
  Conductor conductor_;
  std::atomic<bool> failed_{false};

  // 最后声明：析构时先 join 线程
  std::jthread conductor_thread_;
  std::jthread sender_thread_;
};

} // namespace mdr
