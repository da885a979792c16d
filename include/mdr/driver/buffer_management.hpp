#pragma once

#include "mdr/core/shared_memory.hpp"
#include "mdr/log.hpp"
#include "mdr/log_buffer/term_log.hpp"
#include "mdr/protocol/destination.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>

namespace mdr {

/**
 * @brief Term Log 的分配者
 *
 * Conductor 只通过这个接口申请 / 释放 Term Log，不关心其存放位置。
 */
class BufferManagement {
public:
  virtual ~BufferManagement() = default;

  /**
   * @brief 为 (destination, session, channel) 分配一个全 0 的 Term Log 区域
   * @throws std::system_error 文件或映射失败
   */
  virtual std::shared_ptr<MappedRegion>
  add_publication(const UdpDestination &destination, std::uint64_t session_id,
                  std::uint64_t channel_id) = 0;

  /// @return false 没有对应的区域
  virtual bool remove_publication(const UdpDestination &destination,
                                  std::uint64_t session_id,
                                  std::uint64_t channel_id) = 0;
};

/**
 * @brief 基于文件映射的实现
 *
 * 路径: `<data_dir>/sender/<host>-<port>/<session_id>/<channel_id>`
 * 客户端通过 NEW_SEND_BUFFER_NOTIFICATION 中的 location 映射同一文件。
 *
 * 区域以 shared_ptr 交出，Sender 与本对象共同持有；最后一个持有者释放时
 * munmap。remove_publication 立即删除文件。
 */
class MappedBufferManagement final : public BufferManagement {
public:
  MappedBufferManagement(std::string data_dir, std::int32_t term_buffer_size)
      : data_dir_(std::move(data_dir)), term_buffer_size_(term_buffer_size) {}

  ~MappedBufferManagement() override { close(); }

  MappedBufferManagement(const MappedBufferManagement &) = delete;
  MappedBufferManagement &operator=(const MappedBufferManagement &) = delete;

  static std::string publication_path(const std::string &data_dir,
                                      const UdpDestination &destination,
                                      std::uint64_t session_id,
                                      std::uint64_t channel_id) {
    return data_dir + "/sender/" + destination.host() + "-" +
           std::to_string(destination.port()) + "/" +
           std::to_string(session_id) + "/" + std::to_string(channel_id);
  }

  std::shared_ptr<MappedRegion>
  add_publication(const UdpDestination &destination, std::uint64_t session_id,
                  std::uint64_t channel_id) override {
    auto path = publication_path(data_dir_, destination, session_id, channel_id);
    auto region = std::make_shared<MappedRegion>(MappedRegion::create(
        path, static_cast<std::size_t>(
                  term_log_descriptor::required_length(term_buffer_size_))));

    regions_[key(destination, session_id, channel_id)] = region;
    MDR_LOG_DEBUG("buffers", "mapped term log {} ({} bytes)", path,
                  region->size());
    return region;
  }

  bool remove_publication(const UdpDestination &destination,
                          std::uint64_t session_id,
                          std::uint64_t channel_id) override {
    auto it = regions_.find(key(destination, session_id, channel_id));
    if (it == regions_.end()) {
      return false;
    }

    // Sender 可能仍映射着该区域；立即删除文件并放弃所有权，
    // 避免它稍后释放时误删同名的新文件
    std::error_code ec;
    std::filesystem::remove(it->second->path(), ec);
    it->second->disown();
    regions_.erase(it);
    return true;
  }

  /// 释放全部区域并尽力删除空目录
  void close() noexcept {
    regions_.clear();

    std::error_code ec;
    const auto sender_dir = std::filesystem::path(data_dir_) / "sender";
    if (std::filesystem::exists(sender_dir, ec)) {
      std::filesystem::remove_all(sender_dir, ec);
      if (ec) {
        MDR_LOG_WARN("buffers", "failed to remove {}: {}", sender_dir.string(),
                     ec.message());
      }
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return regions_.size(); }
  [[nodiscard]] const std::string &data_dir() const noexcept { return data_dir_; }

private:
  using Key = std::tuple<std::uint32_t, std::uint16_t, std::uint64_t, std::uint64_t>;

  static Key key(const UdpDestination &d, std::uint64_t session_id,
                 std::uint64_t channel_id) noexcept {
    return {d.address(), d.port(), session_id, channel_id};
  }

  std::string data_dir_;
  std::int32_t term_buffer_size_;
  std::map<Key, std::shared_ptr<MappedRegion>> regions_;
};

} // namespace mdr
