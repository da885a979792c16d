#include "mdr/driver/buffer_management.hpp"
#include "mdr/driver/conductor_buffers.hpp"
#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <gtest/gtest.h>

#include <filesystem>

using namespace mdr;
using namespace mdr::test;

class BufferManagementTest : public ::testing::Test {
protected:
  TempDir dir_{generate_unique_dir("buffers")};
  UdpDestination destination_ = UdpDestination::parse("udp://localhost:40123");
};

TEST_F(BufferManagementTest, PublicationPathLayout) {
  EXPECT_EQ(MappedBufferManagement::publication_path("/data", destination_, 7, 9),
            "/data/sender/127.0.0.1-40123/7/9");
}

TEST_F(BufferManagementTest, AddMapsZeroedTermLog) {
  MappedBufferManagement buffers(dir_.path(), 4096);

  auto region = buffers.add_publication(destination_, 7, 9);
  ASSERT_NE(region, nullptr);
  EXPECT_EQ(static_cast<std::int64_t>(region->size()),
            term_log_descriptor::required_length(4096));
  EXPECT_EQ(region->path(),
            MappedBufferManagement::publication_path(dir_.path(), destination_, 7, 9));
  EXPECT_TRUE(std::filesystem::exists(region->path()));
  EXPECT_EQ(buffers.size(), 1u);

  TermLog log(region->buffer());
  EXPECT_EQ(log.term_capacity(), 4096);
}

// 删除后文件立即消失；仍持有区域的一方可以继续访问映射
TEST_F(BufferManagementTest, RemoveDeletesFileButKeepsMapping) {
  MappedBufferManagement buffers(dir_.path(), 4096);
  auto region = buffers.add_publication(destination_, 7, 9);
  const std::string path = region->path();

  EXPECT_TRUE(buffers.remove_publication(destination_, 7, 9));
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_EQ(buffers.size(), 0u);
  EXPECT_FALSE(buffers.remove_publication(destination_, 7, 9));

  region->buffer().put_int64(0, 42);
  EXPECT_EQ(region->buffer().get_int64(0), 42);

  // 同名的新区域不会被旧持有者的析构删除
  auto replacement = buffers.add_publication(destination_, 7, 9);
  region.reset();
  EXPECT_TRUE(std::filesystem::exists(replacement->path()));
}

TEST_F(BufferManagementTest, CloseRemovesSenderDirectory) {
  std::string path;
  {
    MappedBufferManagement buffers(dir_.path(), 4096);
    path = buffers.add_publication(destination_, 1, 1)->path();
    (void)buffers.add_publication(destination_, 1, 2);
  }
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(dir_.path() + "/sender"));
}

TEST_F(BufferManagementTest, ConductorBuffersSharedWithClient) {
  ConductorBuffers driver(dir_.path() + "/conductor", 4096);
  ConductorBuffers client(dir_.path() + "/conductor");

  EXPECT_EQ(driver.to_driver().capacity(), 4096);
  EXPECT_EQ(client.to_client().capacity(), 4096);
  EXPECT_EQ(driver.to_driver_path(), client.to_driver_path());

  AlignedBuffer msg(16);
  msg.view().put_int64(0, 1234);
  ASSERT_TRUE(client.to_driver().write(1, msg.view(), 0, 8));

  int seen = 0;
  driver.to_driver().read([&](std::int32_t type_id, const AtomicBuffer &buf,
                              std::int32_t index, std::int32_t) {
    EXPECT_EQ(type_id, 1);
    EXPECT_EQ(buf.get_int64(index), 1234);
    ++seen;
  });
  EXPECT_EQ(seen, 1);
}

TEST_F(BufferManagementTest, ClientOpenWithoutDriverFails) {
  EXPECT_THROW(ConductorBuffers(dir_.path() + "/missing"), std::system_error);
}
