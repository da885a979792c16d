#pragma once

#include "mdr/config.hpp"
#include "mdr/core/queue.hpp"
#include "mdr/core/timer_wheel.hpp"
#include "mdr/driver/flow_control.hpp"
#include "mdr/driver/sender_channel.hpp"
#include "mdr/log.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>

namespace mdr {

/**
 * @brief Conductor -> Sender 的交接命令
 *
 * 只能移动，经 SPSC 队列传递。AddChannel 的 SenderChannel 所有权随命令
 * 一起移交；命令在任何一端被丢弃时通道随之析构。
 */
struct SenderCommand {
  enum class Kind : std::int32_t {
    AddChannel,
    RemoveChannel,
    StatusMessage,
  };

  Kind kind = Kind::AddChannel;
  std::uint64_t registration_id = 0;
  std::unique_ptr<SenderChannel> channel;
  StatusUpdate status{};
};

using SenderQueue = BoundedQueue<SenderCommand, config::SENDER_QUEUE_CAPACITY>;

/**
 * @brief 发送线程的工作单元
 *
 * 每次 process():
 * 1. 处理 Conductor 交来的命令 (增删通道、状态消息)。
 * 2. 推进时间轮，到期的心跳定时器标记通道。
 * 3. 每个通道发送一轮。发出任何数据报 (数据或心跳) 后，该通道的心跳
 *    定时器重新从 now 开始计时，因此心跳只在连续 heartbeat_timeout 没有
 *    发送时出现。
 *
 * 通道只由本线程访问，无锁。
 */
class Sender {
public:
  static constexpr int COMMAND_LIMIT = 16;

  Sender(const DriverConfig &cfg, SenderQueue &queue)
      : queue_(queue), clock_(cfg.clock()),
        heartbeat_timeout_ns_(cfg.heartbeat_timeout.count()),
        wheel_(cfg.tick_duration, cfg.ticks_per_wheel, clock_()) {}

  ~Sender() { close(); }

  Sender(const Sender &) = delete;
  Sender &operator=(const Sender &) = delete;

  /// @return 本轮完成的工作量，0 表示空闲
  int process() {
    int work = queue_.drain(
        [this](SenderCommand &cmd) { on_command(cmd); }, COMMAND_LIMIT);

    const std::int64_t now = clock_();
    work += wheel_.advance(now, [this](std::uint64_t token, TimerWheel::TimerId) {
      on_heartbeat_timer(token);
    });

    for (auto &[id, channel] : channels_) {
      const int sent = channel->send();
      if (sent > 0) {
        restart_heartbeat_timer(id, *channel, now);
      }
      work += sent;
    }
    return work;
  }

  /// 释放所有通道，包括仍在队列中尚未接收的通道
  void close() noexcept {
    channels_.clear();
    while (queue_.try_pop()) {
    }
  }

  [[nodiscard]] std::size_t channel_count() const noexcept {
    return channels_.size();
  }
  [[nodiscard]] const SenderChannel *channel(std::uint64_t registration_id) const {
    auto it = channels_.find(registration_id);
    return it == channels_.end() ? nullptr : it->second.get();
  }
  [[nodiscard]] const TimerWheel &timer_wheel() const noexcept { return wheel_; }

private:
  void on_command(SenderCommand &cmd) {
    switch (cmd.kind) {
    case SenderCommand::Kind::AddChannel: {
      std::unique_ptr<SenderChannel> channel = std::move(cmd.channel);
      channel->heartbeat_timer =
          wheel_.schedule(clock_() + heartbeat_timeout_ns_, cmd.registration_id);
      MDR_LOG_DEBUG("sender", "channel {} added session={} channel={} dest={}",
                    cmd.registration_id, channel->session_id(),
                    channel->channel_id(), channel->destination().canonical());
      channels_[cmd.registration_id] = std::move(channel);
      break;
    }
    case SenderCommand::Kind::RemoveChannel: {
      auto it = channels_.find(cmd.registration_id);
      if (it != channels_.end()) {
        wheel_.cancel(it->second->heartbeat_timer);
        channels_.erase(it);
        MDR_LOG_DEBUG("sender", "channel {} removed", cmd.registration_id);
      }
      break;
    }
    case SenderCommand::Kind::StatusMessage: {
      auto it = channels_.find(cmd.registration_id);
      if (it != channels_.end()) {
        it->second->on_status_message(cmd.status);
      }
      break;
    }
    }
  }

  // 定时器到期即视为空闲满一个周期；下一次发送成功后由
  // restart_heartbeat_timer 重新调度
  void on_heartbeat_timer(std::uint64_t registration_id) {
    auto it = channels_.find(registration_id);
    if (it != channels_.end()) {
      it->second->heartbeat_due();
    }
  }

  void restart_heartbeat_timer(std::uint64_t registration_id, SenderChannel &channel,
                               std::int64_t now) {
    wheel_.cancel(channel.heartbeat_timer);
    channel.heartbeat_timer = wheel_.schedule(now + heartbeat_timeout_ns_, registration_id);
  }

  SenderQueue &queue_;
  NanoClock clock_;
  std::int64_t heartbeat_timeout_ns_;
  TimerWheel wheel_;
  std::unordered_map<std::uint64_t, std::unique_ptr<SenderChannel>> channels_;
};

} // namespace mdr
