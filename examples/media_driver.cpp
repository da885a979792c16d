#include "mdr/driver/media_driver.hpp"
#include "mdr/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// 独立运行的 Media Driver 进程
//
// 配置来自环境变量:
//   MDR_DIR=/dev/shm/mdr MDR_TERM_BUFFER_SIZE=65536 MDR_MTU=4096 ./media_driver
// Ctrl+C 退出并清理 <dir>/conductor 与 <dir>/data。

namespace {
std::atomic<bool> running{true};

void on_signal(int) { running.store(false, std::memory_order_relaxed); }
} // namespace

int main() {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    mdr::MediaDriver driver(mdr::DriverConfig::from_env());
    driver.start();
    MDR_LOG_INFO("main", "driver running at {}, press Ctrl+C to stop",
                 driver.config().dir);

    while (running.load(std::memory_order_relaxed) && !driver.has_failed()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    driver.close();
    if (driver.has_failed()) {
      MDR_LOG_ERROR("main", "driver stopped after a worker failure");
      return 1;
    }
    MDR_LOG_INFO("main", "driver stopped");
  } catch (const std::exception &e) {
    std::cerr << "media_driver: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
