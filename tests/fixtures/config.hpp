#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <unistd.h>

namespace mdr::test {

// 测试配置常量
struct TestConfig {
  static constexpr auto LONG_TIMEOUT = std::chrono::seconds(5);

  // 并发测试
  static constexpr int NUM_THREADS = 4;
  static constexpr int STRESS_ITERATIONS = 100000;

  static constexpr std::int32_t TERM_BUFFER_SIZE = 64 * 1024;
  static constexpr std::int32_t COMMAND_BUFFER_SIZE = 64 * 1024;
  static constexpr std::int32_t MTU = 1024;

  static constexpr std::uint64_t CHANNEL_ID = 0xA;
  static constexpr std::uint64_t SESSION_ID = 0xdeadbeef;

  // 临时目录前缀
  static inline const std::string DIR_PREFIX = "mdr_test_";
};

// 生成唯一的临时目录路径 (不创建)
inline std::string generate_unique_dir(const std::string &prefix = "dir") {
  static std::atomic<int> counter{0};
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  auto base = std::filesystem::temp_directory_path();
  return (base / (TestConfig::DIR_PREFIX + prefix + "_" +
                  std::to_string(::getpid()) + "_" + std::to_string(now) +
                  "_" + std::to_string(counter++)))
      .string();
}

// 随机负载生成器
class TestDataGenerator {
  std::mt19937 rng_{std::random_device{}()};
  std::uniform_int_distribution<int> dist_{0, 255};

public:
  std::string bytes(std::size_t n) {
    std::string out(n, '\0');
    for (auto &c : out) {
      c = static_cast<char>(dist_(rng_));
    }
    return out;
  }
};

} // namespace mdr::test
