#include "mdr/core/ring_buffer.hpp"
#include "mdr/platform.hpp"
#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <vector>

using namespace mdr;
using namespace mdr::test;

class ManyToOneRingBufferTest : public ::testing::Test {
protected:
  static constexpr std::int32_t CAPACITY = 1024;
  static constexpr std::int32_t MSG_TYPE_ID = 7;

  AlignedBuffer storage_{CAPACITY + ring_buffer_descriptor::TRAILER_LENGTH};
  ManyToOneRingBuffer rb_{storage_.view()};
  AlignedBuffer src_storage_{256};
  AtomicBuffer src_ = src_storage_.view();
};

TEST_F(ManyToOneRingBufferTest, Initialization) {
  EXPECT_EQ(rb_.capacity(), CAPACITY);
  EXPECT_EQ(rb_.max_msg_length(), CAPACITY / 8);
  EXPECT_EQ(rb_.size(), 0);
}

TEST_F(ManyToOneRingBufferTest, RejectsNonPowerOfTwoCapacity) {
  AlignedBuffer bad(1000 + ring_buffer_descriptor::TRAILER_LENGTH);
  EXPECT_THROW(ManyToOneRingBuffer{bad.view()}, std::invalid_argument);
}

TEST_F(ManyToOneRingBufferTest, WriteThenRead) {
  src_.put_int64(0, 0x1122334455667788);
  ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, 8));
  EXPECT_EQ(rb_.size(), 16);

  int calls = 0;
  int read = rb_.read([&](std::int32_t type_id, const AtomicBuffer &buf,
                          std::int32_t index, std::int32_t length) {
    ++calls;
    EXPECT_EQ(type_id, MSG_TYPE_ID);
    EXPECT_EQ(length, 8);
    EXPECT_EQ(buf.get_int64(index), 0x1122334455667788);
  });

  EXPECT_EQ(read, 1);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(rb_.size(), 0);
}

TEST_F(ManyToOneRingBufferTest, FifoOrderAndLimit) {
  for (std::int32_t i = 0; i < 5; ++i) {
    src_.put_int32(0, i);
    ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, 4));
  }

  std::vector<std::int32_t> seen;
  auto handler = [&](std::int32_t, const AtomicBuffer &buf, std::int32_t index,
                     std::int32_t) { seen.push_back(buf.get_int32(index)); };

  EXPECT_EQ(rb_.read(handler, 2), 2);
  EXPECT_EQ(rb_.read(handler), 3);
  EXPECT_EQ(seen, (std::vector<std::int32_t>{0, 1, 2, 3, 4}));
}

TEST_F(ManyToOneRingBufferTest, InvalidArguments) {
  EXPECT_THROW((void)rb_.write(0, src_, 0, 4), std::invalid_argument);
  EXPECT_THROW((void)rb_.write(-1, src_, 0, 4), std::invalid_argument);
  EXPECT_THROW((void)rb_.write(MSG_TYPE_ID, src_, 0, rb_.max_msg_length() + 1),
               std::invalid_argument);
}

// 累计写入超过容量且不读取，必然出现写失败
TEST_F(ManyToOneRingBufferTest, BackpressureWhenFull) {
  const std::int32_t length = rb_.max_msg_length() - record_descriptor::HEADER_LENGTH;
  const std::int32_t record = align(length + record_descriptor::HEADER_LENGTH,
                                    record_descriptor::ALIGNMENT);

  int accepted = 0;
  bool rejected = false;
  for (std::int32_t written = 0; written <= CAPACITY; written += record) {
    if (rb_.write(MSG_TYPE_ID, src_, 0, length)) {
      ++accepted;
    } else {
      rejected = true;
    }
  }

  EXPECT_TRUE(rejected);
  EXPECT_EQ(accepted, CAPACITY / record);
  EXPECT_EQ(rb_.size(), accepted * record);
}

// 反复写入/读出不同长度的消息，tail 多次回绕后内容依然完整
TEST_F(ManyToOneRingBufferTest, WrapAroundPreservesMessages) {
  for (std::int32_t i = 0; i < 200; ++i) {
    const std::int32_t length = 8 + (i * 24) % 112;
    src_.put_int32(0, i);
    ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, length));

    int delivered = 0;
    while (delivered == 0) {
      rb_.read([&](std::int32_t type_id, const AtomicBuffer &buf,
                   std::int32_t index, std::int32_t len) {
        EXPECT_EQ(type_id, MSG_TYPE_ID);
        EXPECT_EQ(len, length);
        EXPECT_EQ(buf.get_int32(index), i);
        ++delivered;
      });
    }
    ASSERT_EQ(rb_.size(), 0);
  }
}

TEST_F(ManyToOneRingBufferTest, PaddingRecordWhenTailCannotFit) {
  // 写到 tail = 896，读空
  for (int i = 0; i < 7; ++i) {
    ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, 120));
  }
  EXPECT_EQ(rb_.read([](auto, const auto &, auto, auto) {}), 7);

  // 剩 128 字节，写 record=136 的消息：在 896 处插入 padding，消息写在 0
  src_.put_int32(0, 4242);
  ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, 128));
  EXPECT_EQ(rb_.size(), 128 + 136);

  int delivered = 0;
  // 第一次读取到末尾 (只有 padding)，第二次读到消息
  rb_.read([&](auto, const auto &, auto, auto) { ++delivered; });
  rb_.read([&](std::int32_t, const AtomicBuffer &buf, std::int32_t index,
               std::int32_t) {
    EXPECT_EQ(buf.get_int32(index), 4242);
    ++delivered;
  });
  EXPECT_EQ(delivered, 1);
  EXPECT_EQ(rb_.size(), 0);
}

// handler 抛异常：异常传播，但消息不会被再次投递
TEST_F(ManyToOneRingBufferTest, HandlerExceptionDoesNotRedeliver) {
  for (std::int32_t i = 0; i < 3; ++i) {
    src_.put_int32(0, i);
    ASSERT_TRUE(rb_.write(MSG_TYPE_ID, src_, 0, 4));
  }

  std::vector<std::int32_t> seen;
  EXPECT_THROW(rb_.read([&](std::int32_t, const AtomicBuffer &buf,
                            std::int32_t index, std::int32_t) {
    const std::int32_t v = buf.get_int32(index);
    seen.push_back(v);
    if (v == 1) {
      throw std::runtime_error("handler failure");
    }
  }),
               std::runtime_error);

  rb_.read([&](std::int32_t, const AtomicBuffer &buf, std::int32_t index,
               std::int32_t) { seen.push_back(buf.get_int32(index)); });

  EXPECT_EQ(seen, (std::vector<std::int32_t>{0, 1, 2}));
  EXPECT_EQ(rb_.size(), 0);
}

TEST_F(ManyToOneRingBufferTest, CorrelationIdsAreUnique) {
  auto a = rb_.next_correlation_id();
  auto b = rb_.next_correlation_id();
  EXPECT_EQ(b, a + 1);
}

// 多生产者并发写入，单消费者读到每条消息恰好一次，且每个生产者内部有序
TEST(ManyToOneRingBufferConcurrency, MultipleProducers) {
  constexpr std::int32_t CAPACITY = 64 * 1024;
  constexpr int PER_PRODUCER = 20000;
  const int producers = TestConfig::NUM_THREADS;

  AlignedBuffer storage(CAPACITY + ring_buffer_descriptor::TRAILER_LENGTH);
  ManyToOneRingBuffer rb(storage.view());

  ThreadRunner runner;
  for (int p = 0; p < producers; ++p) {
    runner.spawn([&rb, p] {
      AlignedBuffer local(16);
      AtomicBuffer src = local.view();
      for (int i = 0; i < PER_PRODUCER; ++i) {
        src.put_int32(0, p);
        src.put_int32(4, i);
        while (!rb.write(1, src, 0, 8)) {
          cpu_relax();
        }
      }
    });
  }

  std::map<int, int> next;
  int total = 0;
  bool ordered = true;
  while (total < producers * PER_PRODUCER) {
    total += rb.read([&](std::int32_t, const AtomicBuffer &buf, std::int32_t index,
                         std::int32_t) {
      const int p = buf.get_int32(index);
      const int seq = buf.get_int32(index + 4);
      if (next[p] != seq) {
        ordered = false;
      }
      next[p] = seq + 1;
    });
  }
  runner.join_all();

  EXPECT_TRUE(ordered);
  for (int p = 0; p < producers; ++p) {
    EXPECT_EQ(next[p], PER_PRODUCER);
  }
  EXPECT_EQ(rb.size(), 0);
}
