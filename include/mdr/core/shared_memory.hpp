#pragma once

#include "mdr/core/atomic_buffer.hpp"
#include "mdr/types.hpp"
#include <cstddef>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <system_error>
#include <tuple>
#include <unistd.h>
#include <utility>

namespace mdr {

namespace detail {

/**
 * @brief 内部资源句柄
 */
struct RawShmHandle {
  int fd = -1;
  void *addr = nullptr;
  std::size_t map_size = 0;
  std::string full_path;

  bool is_valid() const { return addr != nullptr && addr != MAP_FAILED; }
};

/**
 * @brief 底层内存映射逻辑
 *
 * @param size owner 模式下为文件大小；非 owner 模式传 0 表示映射整个文件
 */
inline RawShmHandle map_raw_bytes(const std::string &path, std::size_t size,
                                  bool is_owner) {
  RawShmHandle handle;
  handle.map_size = size;
  handle.full_path = std::filesystem::path(path).lexically_normal().string();

  int flags = O_RDWR;
  if (is_owner) {
    flags |= O_CREAT | O_EXCL;
    // 清理上一次异常退出遗留的旧文件，防止 EEXIST
    ::unlink(handle.full_path.c_str());

    std::error_code ec;
    auto parent = std::filesystem::path(handle.full_path).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw std::system_error(ec, "create_directories failed: " +
                                        parent.string());
      }
    }
  }

  // 1. Open
  handle.fd = ::open(handle.full_path.c_str(), flags, S_IRUSR | S_IWUSR);
  if (handle.fd == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "open failed: " + handle.full_path);
  }

  // 守卫 fd，防止后续异常导致泄漏
  std::unique_ptr<int, void (*)(int *)> fd_guard(&handle.fd, [](int *fd) {
    if (*fd != -1) {
      ::close(*fd);
      *fd = -1;
    }
  });

  // 2. 设置/检查大小 (ftruncate/fstat)
  if (is_owner) {
    if (::ftruncate(handle.fd, static_cast<off_t>(handle.map_size)) == -1) {
      throw std::system_error(errno, std::generic_category(),
                              "ftruncate failed: " + handle.full_path);
    }
  } else {
    struct stat s;
    if (::fstat(handle.fd, &s) == -1) {
      throw std::system_error(errno, std::generic_category(),
                              "fstat failed: " + handle.full_path);
    }
    // 文件比期望小时映射后访问会触发 SIGBUS，必须提前拒绝
    if (handle.map_size == 0) {
      handle.map_size = static_cast<std::size_t>(s.st_size);
    } else if (static_cast<std::size_t>(s.st_size) < handle.map_size) {
      throw std::runtime_error("Shared memory size mismatch: file too small: " +
                               handle.full_path);
    }
    if (handle.map_size == 0) {
      throw std::runtime_error("Shared memory file is empty: " +
                               handle.full_path);
    }
  }

  // 3. 内存映射 (mmap)
  handle.addr = ::mmap(nullptr, handle.map_size, PROT_READ | PROT_WRITE,
                       MAP_SHARED, handle.fd, 0);
  if (handle.addr == MAP_FAILED) {
    handle.addr = nullptr;
    throw std::system_error(errno, std::generic_category(),
                            "mmap failed: " + handle.full_path);
  }

  // 释放 guard，fd 的所有权转移给 handle
  std::ignore = fd_guard.release();
  return handle;
}

/**
 * @brief 底层资源释放
 */
inline void unmap_raw_bytes(RawShmHandle &handle, bool unlink_file) noexcept {
  if (handle.is_valid()) {
    ::munmap(handle.addr, handle.map_size);
    handle.addr = nullptr;
  }

  if (handle.fd != -1) {
    ::close(handle.fd);
    handle.fd = -1;
  }

  if (unlink_file && !handle.full_path.empty()) {
    ::unlink(handle.full_path.c_str());
  }
}

} // namespace detail

/**
 * @brief 文件映射共享内存区域的 RAII 封装
 *
 * Term Log 与命令缓冲区都是这样一个区域：Driver 以 owner 身份创建，
 * Sender / 客户端以非 owner 身份映射同一文件。owner 析构时删除文件；
 * 已映射的其它进程不受影响，直到它们自己 munmap。
 */
class MappedRegion {
public:
  MappedRegion() = default;

  ~MappedRegion() { cleanup(); }

  // Non-copyable
  MappedRegion(const MappedRegion &) = delete;
  MappedRegion &operator=(const MappedRegion &) = delete;

  // Movable
  MappedRegion(MappedRegion &&other) noexcept
      : handle_(std::exchange(other.handle_, {})),
        is_owner_(std::exchange(other.is_owner_, false)) {}

  MappedRegion &operator=(MappedRegion &&other) noexcept {
    if (this != &other) {
      cleanup();
      handle_ = std::exchange(other.handle_, {});
      is_owner_ = std::exchange(other.is_owner_, false);
    }
    return *this;
  }

  /**
   * @brief 创建并映射一个新文件 (内容全部为 0)
   * @throws std::system_error 文件或映射失败
   */
  static MappedRegion create(const std::string &path, std::size_t size) {
    check_size(size);
    MappedRegion region;
    region.handle_ = detail::map_raw_bytes(path, size, true);
    region.is_owner_ = true;
    return region;
  }

  /**
   * @brief 映射已存在的文件
   * @param expected_size 0 表示映射整个文件
   */
  static MappedRegion open(const std::string &path,
                           std::size_t expected_size = 0) {
    MappedRegion region;
    region.handle_ = detail::map_raw_bytes(path, expected_size, false);
    check_size(region.handle_.map_size);
    return region;
  }

  explicit operator bool() const noexcept { return handle_.is_valid(); }

  [[nodiscard]] std::uint8_t *data() const noexcept {
    return static_cast<std::uint8_t *>(handle_.addr);
  }
  [[nodiscard]] std::size_t size() const noexcept { return handle_.map_size; }
  [[nodiscard]] const std::string &path() const noexcept {
    return handle_.full_path;
  }
  [[nodiscard]] bool is_owner() const noexcept { return is_owner_; }

  [[nodiscard]] AtomicBuffer buffer() const noexcept {
    return AtomicBuffer(data(), static_cast<std::int32_t>(size()));
  }

  /// 放弃删除文件的责任 (例如所有权交给其它进程)
  void disown() noexcept { is_owner_ = false; }

private:
  static void check_size(std::size_t size) {
    if (size == 0 || size > static_cast<std::size_t>(
                                std::numeric_limits<std::int32_t>::max())) {
      throw std::invalid_argument("mapped region size out of range: " +
                                  std::to_string(size));
    }
  }

  void cleanup() noexcept { detail::unmap_raw_bytes(handle_, is_owner_); }

  detail::RawShmHandle handle_;
  bool is_owner_ = false;
};

} // namespace mdr
