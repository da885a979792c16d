#include "mdr/config.hpp"
#include "mdr/log.hpp"
#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

using namespace mdr;

namespace {

// 作用域内设置环境变量
class ScopedEnv {
  const char *name_;

public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
};

} // namespace

TEST(DriverConfigTest, DefaultsAreValid) {
  DriverConfig cfg;
  EXPECT_NO_THROW(cfg.validate());

  EXPECT_EQ(cfg.term_buffer_size, 64 * 1024);
  EXPECT_EQ(cfg.mtu, 4096);
  EXPECT_EQ(cfg.heartbeat_timeout, std::chrono::milliseconds(100));
  EXPECT_EQ(cfg.admin_dir(), cfg.dir + "/conductor");
  EXPECT_EQ(cfg.data_dir(), cfg.dir + "/data");
}

TEST(DriverConfigTest, RejectsInvalidValues) {
  auto invalid = [](auto mutate) {
    DriverConfig cfg;
    mutate(cfg);
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
  };

  invalid([](DriverConfig &c) { c.term_buffer_size = 3000; });
  invalid([](DriverConfig &c) { c.term_buffer_size = 512; });
  invalid([](DriverConfig &c) { c.command_buffer_size = 1000; });
  invalid([](DriverConfig &c) { c.command_buffer_size = 512; });
  invalid([](DriverConfig &c) { c.mtu = 1001; });
  invalid([](DriverConfig &c) { c.mtu = 32; });
  invalid([](DriverConfig &c) {
    c.term_buffer_size = 4096;
    c.mtu = 4096;
  });
  invalid([](DriverConfig &c) { c.ticks_per_wheel = 100; });
  invalid([](DriverConfig &c) { c.tick_duration = std::chrono::nanoseconds(0); });
}

TEST(DriverConfigTest, AcceptsMinimumCommandBuffer) {
  DriverConfig cfg;
  cfg.command_buffer_size = config::COMMAND_BUFFER_SIZE_MIN;
  EXPECT_NO_THROW(cfg.validate());
}

TEST(DriverConfigTest, ClockDefaultsToSteadyClock) {
  DriverConfig cfg;
  const auto a = cfg.clock()();
  const auto b = cfg.clock()();
  EXPECT_LE(a, b);

  cfg.nano_clock = [] { return std::int64_t{42}; };
  EXPECT_EQ(cfg.clock()(), 42);
}

TEST(DriverConfigTest, FromEnvironment) {
  ScopedEnv dir("MDR_DIR", "/tmp/mdr-env");
  ScopedEnv term("MDR_TERM_BUFFER_SIZE", "131072");
  ScopedEnv mtu("MDR_MTU", "1408");
  ScopedEnv hb("MDR_HEARTBEAT_TIMEOUT_MS", "250");
  ScopedEnv lvl("MDR_LOG_LEVEL", "debug");

  auto cfg = DriverConfig::from_env();
  EXPECT_EQ(cfg.dir, "/tmp/mdr-env");
  EXPECT_EQ(cfg.term_buffer_size, 131072);
  EXPECT_EQ(cfg.mtu, 1408);
  EXPECT_EQ(cfg.heartbeat_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(cfg.log_level, log::Level::Debug);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(DriverConfigTest, FromEnvironmentRejectsGarbage) {
  {
    ScopedEnv term("MDR_TERM_BUFFER_SIZE", "64k");
    EXPECT_THROW((void)DriverConfig::from_env(), std::invalid_argument);
  }
  {
    ScopedEnv lvl("MDR_LOG_LEVEL", "loud");
    EXPECT_THROW((void)DriverConfig::from_env(), std::invalid_argument);
  }
}

TEST(LogTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("WARN"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("Off"), log::Level::Off);
  EXPECT_FALSE(log::parse_level("verbose").has_value());
}

TEST(LogTest, LevelFiltering) {
  const auto saved = log::level();

  log::set_level(log::Level::Warn);
  EXPECT_FALSE(log::enabled(log::Level::Info));
  EXPECT_TRUE(log::enabled(log::Level::Warn));
  EXPECT_TRUE(log::enabled(log::Level::Error));

  log::set_level(log::Level::Off);
  EXPECT_FALSE(log::enabled(log::Level::Error));
  MDR_LOG_ERROR("test", "suppressed {}", 1);

  log::set_level(saved);
}
