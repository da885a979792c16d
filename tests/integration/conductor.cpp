#include "../fixtures/driver_fixture.hpp"
#include <gtest/gtest.h>

#include <filesystem>

using namespace mdr;
using namespace mdr::test;

class ConductorTest : public DriverTestFixture {
protected:
  // 读取一条 ERROR_RESPONSE 并校验其附带的请求
  ErrorCode expect_error(std::string_view destination, std::uint64_t session_id,
                         std::uint64_t channel_id) {
    auto ev = read_event();
    EXPECT_TRUE(ev.has_value());
    if (!ev) {
      return ErrorCode::GenericError;
    }
    EXPECT_EQ(ev->type_id, control_protocol::ERROR_RESPONSE);

    AtomicBuffer buf = ev->buffer();
    ErrorFlyweight error(buf, 0);
    EXPECT_FALSE(error.error_message().empty());

    ChannelMessageFlyweight echoed(buf, error.offending_header_offset());
    EXPECT_EQ(echoed.destination(), destination);
    EXPECT_EQ(echoed.session_id(), session_id);
    EXPECT_EQ(echoed.channel_id(), channel_id);
    EXPECT_EQ(error.offending_header_length(), echoed.length());
    return error.error_code();
  }

  UdpDestination destination() const { return UdpDestination::parse(uri()); }
};

TEST_F(ConductorTest, AddChannelSendsNotification) {
  write_channel_message(control_protocol::ADD_CHANNEL, uri(), TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);
  process(5);

  auto ev = read_event();
  ASSERT_TRUE(ev.has_value());
  ASSERT_EQ(ev->type_id, control_protocol::NEW_SEND_BUFFER_NOTIFICATION);

  NewBufferMessageFlyweight n(ev->buffer(), 0);
  EXPECT_EQ(n.session_id(), TestConfig::SESSION_ID);
  EXPECT_EQ(n.channel_id(), TestConfig::CHANNEL_ID);
  EXPECT_EQ(n.destination(), uri());

  // 客户端可以映射通知中的 Term Log
  const std::string location(n.location());
  ASSERT_TRUE(std::filesystem::exists(location));
  auto region = MappedRegion::open(location);
  TermLog log(region.buffer());
  EXPECT_EQ(log.term_capacity(), TestConfig::TERM_BUFFER_SIZE);
  EXPECT_EQ(log.mtu(), TestConfig::MTU);
  EXPECT_EQ(log.session_id(), TestConfig::SESSION_ID);
  EXPECT_EQ(log.channel_id(), TestConfig::CHANNEL_ID);
  EXPECT_EQ(log.initial_term_id(), 0);

  EXPECT_EQ(driver_->conductor().publication_count(), 1u);
  EXPECT_NE(driver_->conductor().frame_handler(destination()), nullptr);
  EXPECT_EQ(driver_->sender().channel_count(), 1u);
  EXPECT_FALSE(read_event().has_value());
}

TEST_F(ConductorTest, DuplicateAddIsRejected) {
  const std::string location = add_channel();
  ASSERT_FALSE(location.empty());

  write_channel_message(control_protocol::ADD_CHANNEL, uri(), TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);
  process(5);

  EXPECT_EQ(expect_error(uri(), TestConfig::SESSION_ID, TestConfig::CHANNEL_ID),
            ErrorCode::ChannelAlreadyExists);
  EXPECT_EQ(driver_->conductor().publication_count(), 1u);
  EXPECT_TRUE(std::filesystem::exists(location));
}

// 同一目的地的不同 URI 写法视为同一目的地
TEST_F(ConductorTest, DuplicateDetectionUsesResolvedAddress) {
  ASSERT_FALSE(add_channel().empty());

  const std::string numeric = "udp://127.0.0.1:" + std::to_string(receiver_.port());
  write_channel_message(control_protocol::ADD_CHANNEL, numeric, TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);
  process(5);

  EXPECT_EQ(expect_error(numeric, TestConfig::SESSION_ID, TestConfig::CHANNEL_ID),
            ErrorCode::ChannelAlreadyExists);
}

TEST_F(ConductorTest, ChannelsShareDestinationTransport) {
  const std::string a = add_channel(1, 10);
  UdpTransport *transport = driver_->conductor().frame_handler(destination());
  ASSERT_NE(transport, nullptr);

  const std::string b = add_channel(1, 11);
  const std::string c = add_channel(2, 10);
  ASSERT_FALSE(b.empty());
  ASSERT_FALSE(c.empty());
  EXPECT_NE(a, b);
  EXPECT_NE(a, c);

  EXPECT_EQ(driver_->conductor().frame_handler(destination()), transport);
  EXPECT_EQ(driver_->conductor().publication_count(), 3u);
  EXPECT_EQ(driver_->sender().channel_count(), 3u);
}

TEST_F(ConductorTest, AddWithInvalidDestination) {
  const char *bad[] = {"tcp://localhost:1", "udp://localhost", "udp://localhost:99999",
                       "garbage"};
  for (const char *dest : bad) {
    write_channel_message(control_protocol::ADD_CHANNEL, dest, 1, 1);
    process(2);
    EXPECT_EQ(expect_error(dest, 1, 1), ErrorCode::InvalidDestination) << dest;
  }
  EXPECT_EQ(driver_->conductor().publication_count(), 0u);
}

TEST_F(ConductorTest, RemoveFromUnknownDestination) {
  ASSERT_FALSE(add_channel().empty());

  UdpReceiver other;
  write_channel_message(control_protocol::REMOVE_CHANNEL, other.uri(),
                        TestConfig::SESSION_ID, TestConfig::CHANNEL_ID);
  process(2);

  EXPECT_EQ(expect_error(other.uri(), TestConfig::SESSION_ID, TestConfig::CHANNEL_ID),
            ErrorCode::InvalidDestination);
  EXPECT_EQ(driver_->conductor().publication_count(), 1u);
}

TEST_F(ConductorTest, RemoveUnknownChannel) {
  ASSERT_FALSE(add_channel().empty());

  write_channel_message(control_protocol::REMOVE_CHANNEL, uri(), 777,
                        TestConfig::CHANNEL_ID);
  process(2);
  EXPECT_EQ(expect_error(uri(), 777, TestConfig::CHANNEL_ID), ErrorCode::ChannelUnknown);

  write_channel_message(control_protocol::REMOVE_CHANNEL, uri(), TestConfig::SESSION_ID,
                        999);
  process(2);
  EXPECT_EQ(expect_error(uri(), TestConfig::SESSION_ID, 999), ErrorCode::ChannelUnknown);
}

TEST_F(ConductorTest, RemoveReleasesResources) {
  const std::string a = add_channel(1, 10);
  const std::string b = add_channel(1, 11);

  write_channel_message(control_protocol::REMOVE_CHANNEL, uri(), 1, 10);
  process(5);

  // 成功删除没有应答
  EXPECT_FALSE(read_event().has_value());
  EXPECT_FALSE(std::filesystem::exists(a));
  EXPECT_TRUE(std::filesystem::exists(b));
  EXPECT_EQ(driver_->conductor().publication_count(), 1u);
  EXPECT_EQ(driver_->sender().channel_count(), 1u);
  // 还有通道，端点保留
  EXPECT_NE(driver_->conductor().frame_handler(destination()), nullptr);

  write_channel_message(control_protocol::REMOVE_CHANNEL, uri(), 1, 11);
  process(5);

  EXPECT_FALSE(std::filesystem::exists(b));
  EXPECT_EQ(driver_->conductor().publication_count(), 0u);
  EXPECT_EQ(driver_->sender().channel_count(), 0u);
  EXPECT_EQ(driver_->conductor().frame_handler(destination()), nullptr);

  // 删除后同一三元组可以重新添加
  EXPECT_FALSE(add_channel(1, 10).empty());
  EXPECT_EQ(driver_->conductor().publication_count(), 1u);
}

// 格式错误与未知类型的命令被丢弃，不影响后续命令
TEST_F(ConductorTest, MalformedCommandsAreDropped) {
  AtomicBuffer buf = write_buffer_.view();
  buf.put_int64(0, 1);
  ASSERT_TRUE(driver_->buffers().to_driver().write(control_protocol::ADD_CHANNEL, buf, 0, 12));

  buf.put_int64(0, 1);
  buf.put_int64(8, 2);
  buf.put_int32(16, 10000);
  ASSERT_TRUE(driver_->buffers().to_driver().write(control_protocol::ADD_CHANNEL, buf, 0, 24));

  ASSERT_TRUE(driver_->buffers().to_driver().write(99, buf, 0, 24));
  process(5);

  EXPECT_FALSE(read_event().has_value());
  EXPECT_EQ(driver_->conductor().publication_count(), 0u);

  EXPECT_FALSE(add_channel().empty());
}

TEST_F(ConductorTest, RunsOnDriverThreads) {
  driver_->start();

  write_channel_message(control_protocol::ADD_CHANNEL, uri(), TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);

  std::optional<ClientEvent> ev;
  auto deadline = std::chrono::steady_clock::now() + TestConfig::LONG_TIMEOUT;
  while (!ev && std::chrono::steady_clock::now() < deadline) {
    ev = read_event();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->type_id, control_protocol::NEW_SEND_BUFFER_NOTIFICATION);

  driver_->close();
  EXPECT_FALSE(driver_->has_failed());
}

// 最小命令缓冲区 + 很长的目录：通知放不下单条消息上限
class SmallCommandBufferTest : public ConductorTest {
protected:
  void customise(DriverConfig &cfg) override {
    cfg.command_buffer_size = config::COMMAND_BUFFER_SIZE_MIN;
    cfg.dir = dir_.path() + "/" + std::string(200, 'd') + "/" + std::string(200, 'e') +
              "/" + std::string(200, 'f');
  }

  std::size_t term_log_files() const {
    std::size_t n = 0;
    std::error_code ec;
    for (const auto &entry : std::filesystem::recursive_directory_iterator(
             driver_->config().data_dir(), ec)) {
      n += entry.is_regular_file() ? 1 : 0;
    }
    return n;
  }
};

TEST_F(SmallCommandBufferTest, OversizedNotificationIsRejected) {
  ASSERT_GT(driver_->config().data_dir().size(),
            static_cast<std::size_t>(driver_->buffers().to_client().max_msg_length()));

  write_channel_message(control_protocol::ADD_CHANNEL, uri(), TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);
  ASSERT_NO_THROW(process(5));

  EXPECT_EQ(expect_error(uri(), TestConfig::SESSION_ID, TestConfig::CHANNEL_ID),
            ErrorCode::ResourceUnavailable);
  EXPECT_EQ(driver_->conductor().publication_count(), 0u);
  EXPECT_EQ(driver_->sender().channel_count(), 0u);
  EXPECT_EQ(driver_->conductor().frame_handler(destination()), nullptr);
  EXPECT_EQ(term_log_files(), 0u);

  // 被拒绝后仍可继续处理命令
  write_channel_message(control_protocol::REMOVE_CHANNEL, uri(), TestConfig::SESSION_ID,
                        TestConfig::CHANNEL_ID);
  ASSERT_NO_THROW(process(5));
  EXPECT_EQ(expect_error(uri(), TestConfig::SESSION_ID, TestConfig::CHANNEL_ID),
            ErrorCode::InvalidDestination);
}

// 请求本身太大无法回显时，仍然回复错误码
TEST_F(SmallCommandBufferTest, ErrorWithoutEchoWhenRequestTooLarge) {
  const std::int32_t max = driver_->buffers().to_client().max_msg_length();
  const std::string destination = "udp://" + std::string(
      static_cast<std::size_t>(max - ChannelMessageFlyweight::DESTINATION_OFFSET - 4 - 12),
      'h') + ":0";
  write_channel_message(control_protocol::ADD_CHANNEL, destination, 1, 1);
  ASSERT_NO_THROW(process(5));

  auto ev = read_event();
  ASSERT_TRUE(ev.has_value());
  ASSERT_EQ(ev->type_id, control_protocol::ERROR_RESPONSE);
  ErrorFlyweight error(ev->buffer(), 0);
  EXPECT_EQ(error.error_code(), ErrorCode::InvalidDestination);
  EXPECT_EQ(error.offending_header_length(), 0);
  EXPECT_FALSE(error.error_message().empty());
}
