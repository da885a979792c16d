#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iterator>
#include <new>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace mdr::log {

/**
 * @brief 日志级别
 *
 * 日志只出现在控制路径 (通道增删、错误应答、线程启停)，
 * 绝不出现在逐帧的数据路径上。
 */
enum class Level : int {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5,
};

inline constexpr std::string_view level_name(Level lvl) noexcept {
  switch (lvl) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  case Level::Off:
    return "OFF";
  }
  return "?";
}

inline std::optional<Level> parse_level(std::string_view name) noexcept {
  for (int i = 0; i <= static_cast<int>(Level::Off); ++i) {
    auto lvl = static_cast<Level>(i);
    auto expected = level_name(lvl);
    if (name.size() != expected.size())
      continue;

    bool match = true;
    for (std::size_t c = 0; c < name.size(); ++c) {
      char ch = name[c];
      if (ch >= 'a' && ch <= 'z')
        ch = static_cast<char>(ch - 'a' + 'A');
      if (ch != expected[c]) {
        match = false;
        break;
      }
    }
    if (match)
      return lvl;
  }
  return std::nullopt;
}

namespace detail {

inline Level initial_level() noexcept {
  if (const char *env = std::getenv("MDR_LOG_LEVEL")) {
    if (auto lvl = parse_level(env))
      return *lvl;
  }
  return Level::Info;
}

inline std::atomic<int> &level_ref() noexcept {
  static std::atomic<int> lvl{static_cast<int>(initial_level())};
  return lvl;
}

} // namespace detail

inline void set_level(Level lvl) noexcept {
  detail::level_ref().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

inline Level level() noexcept {
  return static_cast<Level>(
      detail::level_ref().load(std::memory_order_relaxed));
}

inline bool enabled(Level lvl) noexcept {
  return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

/**
 * @brief 格式化并输出一行日志到 stderr
 *
 * 格式: `[HH:MM:SS.uuuuuu] [LEVEL] [component] message`
 * 每行一次 fwrite，多线程下不会交错。格式化失败不会向调用方抛出。
 */
template <typename... Args>
void write(Level lvl, std::string_view component,
           fmt::format_string<Args...> fmt_str, Args &&...args) noexcept {
  if (!enabled(lvl))
    return;

  try {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  now.time_since_epoch()) %
              std::chrono::seconds(1);
    std::time_t secs = std::chrono::system_clock::to_time_t(now);

    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "[{:%H:%M:%S}.{:06d}] [{}] [{}] ",
                   fmt::localtime(secs), us.count(), level_name(lvl),
                   component);
    fmt::format_to(std::back_inserter(buf), fmt_str,
                   std::forward<Args>(args)...);
    buf.push_back('\n');
    std::fwrite(buf.data(), 1, buf.size(), stderr);
  } catch (const fmt::format_error &e) {
    std::fprintf(stderr, "[log] format error: %s\n", e.what());
  } catch (const std::bad_alloc &) {
    std::fputs("[log] out of memory while formatting\n", stderr);
  }
}

} // namespace mdr::log

#define MDR_LOG_TRACE(component, ...)                                          \
  ::mdr::log::write(::mdr::log::Level::Trace, component, __VA_ARGS__)
#define MDR_LOG_DEBUG(component, ...)                                          \
  ::mdr::log::write(::mdr::log::Level::Debug, component, __VA_ARGS__)
#define MDR_LOG_INFO(component, ...)                                           \
  ::mdr::log::write(::mdr::log::Level::Info, component, __VA_ARGS__)
#define MDR_LOG_WARN(component, ...)                                           \
  ::mdr::log::write(::mdr::log::Level::Warn, component, __VA_ARGS__)
#define MDR_LOG_ERROR(component, ...)                                          \
  ::mdr::log::write(::mdr::log::Level::Error, component, __VA_ARGS__)
