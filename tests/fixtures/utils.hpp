#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/core/socket.hpp"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace mdr::test {

// RAII 临时目录
class TempDir {
  std::string path_;

public:
  explicit TempDir(std::string path) : path_(std::move(path)) {}

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }
};

// 8 字节对齐的堆缓冲区 + AtomicBuffer 视图
class AlignedBuffer {
  std::vector<std::uint64_t> storage_;

public:
  explicit AlignedBuffer(std::int32_t length)
      : storage_((static_cast<std::size_t>(length) + 7) / 8, 0) {}

  AtomicBuffer view() {
    return AtomicBuffer(reinterpret_cast<std::uint8_t *>(storage_.data()),
                        static_cast<std::int32_t>(storage_.size() * 8));
  }
};

// 线程辅助工具
class ThreadRunner {
  std::vector<std::thread> threads_;

public:
  template <typename Func, typename... Args>
  void spawn(Func &&func, Args &&...args) {
    threads_.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
  }

  void join_all() {
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  ~ThreadRunner() { join_all(); }
};

// 测试用 UDP 接收端 (绑定 127.0.0.1 临时端口)
class UdpReceiver {
  net::Socket socket_{SOCK_DGRAM};
  std::uint16_t port_ = 0;
  alignas(8) std::array<std::uint8_t, 64 * 1024> buf_{};

public:
  UdpReceiver() {
    socket_.bind("127.0.0.1", 0);
    port_ = ntohs(socket_.local_address().sin_port);
  }

  std::uint16_t port() const { return port_; }
  std::string uri() const { return "udp://localhost:" + std::to_string(port_); }

  struct Datagram {
    AtomicBuffer buffer;
    std::int32_t length;
    sockaddr_in from;
  };

  // 非阻塞读取一个数据报
  std::optional<Datagram> poll() {
    sockaddr_in from{};
    ssize_t n = socket_.receive_from(buf_, from);
    if (n < 0) {
      return std::nullopt;
    }
    return Datagram{AtomicBuffer(buf_.data(), static_cast<std::int32_t>(n)),
                    static_cast<std::int32_t>(n), from};
  }

  // 等待数据报到达 (loopback 上通常立即可见)
  std::optional<Datagram>
  receive(std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (auto d = poll()) {
        return d;
      }
      std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
    return std::nullopt;
  }

  ssize_t send_to(std::span<const std::uint8_t> bytes, const sockaddr_in &to) {
    return socket_.send_to(bytes, to);
  }
};

// 进程 Fork 辅助类
class ForkedProcess {
  pid_t pid_ = -1;

public:
  enum class Role { Parent, Child };

  Role fork() {
    pid_ = ::fork();
    EXPECT_GE(pid_, 0) << "Fork failed: " << strerror(errno);
    return (pid_ == 0) ? Role::Child : Role::Parent;
  }

  [[noreturn]] void child_exit(int status = 0) { ::_exit(status); }

  int wait_child() {
    if (pid_ <= 0)
      return -1;
    int status = 0;
    waitpid(std::exchange(pid_, -1), &status, 0);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }

  ~ForkedProcess() {
    if (pid_ > 0) {
      wait_child();
    }
  }
};

} // namespace mdr::test
