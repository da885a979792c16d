#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "mdr/core/ring_buffer.hpp"
#include "mdr/platform.hpp"

// ============================================================================
// 辅助工具：8 字节对齐的环形缓冲区存储
// ============================================================================

template <std::int32_t Capacity> struct RingStorage {
  std::vector<std::uint64_t> words =
      std::vector<std::uint64_t>((Capacity + mdr::ring_buffer_descriptor::TRAILER_LENGTH) / 8);

  mdr::AtomicBuffer view() {
    return mdr::AtomicBuffer(reinterpret_cast<std::uint8_t *>(words.data()),
                             static_cast<std::int32_t>(words.size() * 8));
  }
};

// ============================================================================
// 1. 单线程 Write/Read 开销
// ============================================================================

template <std::int32_t PayloadSize, std::int32_t Capacity>
static void BM_RingBuffer_WriteRead(benchmark::State &state) {
  RingStorage<Capacity> storage;
  mdr::ManyToOneRingBuffer rb(storage.view());
  alignas(8) std::uint8_t payload[PayloadSize] = {};
  mdr::AtomicBuffer src(payload, PayloadSize);

  for ([[maybe_unused]] auto _ : state) {
    bool ok = rb.write(1, src, 0, PayloadSize);
    benchmark::DoNotOptimize(ok);
    int n = rb.read([](std::int32_t, const mdr::AtomicBuffer &buf, std::int32_t index,
                       std::int32_t) {
      auto v = buf.get_int64(index);
      benchmark::DoNotOptimize(v);
    });
    benchmark::DoNotOptimize(n);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(state.iterations() * PayloadSize);
}

// 批量写满一半容量后一次性读出
template <std::int32_t PayloadSize, std::int32_t Capacity>
static void BM_RingBuffer_BatchRead(benchmark::State &state) {
  RingStorage<Capacity> storage;
  mdr::ManyToOneRingBuffer rb(storage.view());
  alignas(8) std::uint8_t payload[PayloadSize] = {};
  mdr::AtomicBuffer src(payload, PayloadSize);
  const std::int32_t batch =
      Capacity / 2 / mdr::align(PayloadSize + mdr::record_descriptor::HEADER_LENGTH,
                                mdr::record_descriptor::ALIGNMENT);

  for ([[maybe_unused]] auto _ : state) {
    for (std::int32_t i = 0; i < batch; ++i) {
      bool ok = rb.write(1, src, 0, PayloadSize);
      benchmark::DoNotOptimize(ok);
    }
    int n = rb.read([](std::int32_t, const mdr::AtomicBuffer &, std::int32_t,
                       std::int32_t) {});
    benchmark::DoNotOptimize(n);
  }
  state.SetItemsProcessed(state.iterations() * batch);
}

// ============================================================================
// 2. 多生产者吞吐量 (Throughput)
// thread 0 为消费者，其余线程为生产者
// ============================================================================

template <std::int32_t PayloadSize>
static void BM_RingBuffer_MultiProducer(benchmark::State &state) {
  static constexpr std::int32_t CAPACITY = 1024 * 1024;
  static RingStorage<CAPACITY> *storage = nullptr;
  static mdr::ManyToOneRingBuffer *rb = nullptr;

  if (state.thread_index() == 0) {
    storage = new RingStorage<CAPACITY>();
    rb = new mdr::ManyToOneRingBuffer(storage->view());
  }

  if (state.thread_index() == 0) {
    for ([[maybe_unused]] auto _ : state) {
      int n = rb->read([](std::int32_t, const mdr::AtomicBuffer &, std::int32_t,
                          std::int32_t) {});
      if (n == 0) {
        mdr::cpu_relax();
      }
    }
  } else {
    alignas(8) std::uint8_t payload[PayloadSize] = {};
    mdr::AtomicBuffer src(payload, PayloadSize);
    std::int64_t written = 0;
    for ([[maybe_unused]] auto _ : state) {
      if (rb->write(1, src, 0, PayloadSize)) {
        ++written;
      } else {
        mdr::cpu_relax();
      }
    }
    state.SetItemsProcessed(written);
  }

  if (state.thread_index() == 0) {
    delete rb;
    delete storage;
    rb = nullptr;
    storage = nullptr;
  }
}

// ============================================================================
// Benchmark 注册宏
// ============================================================================

#define REGISTER_MATRIX(FUNC, ...)                                             \
  BENCHMARK_TEMPLATE(FUNC, 8, 4096)->Name(#FUNC "/P:8/C:4K") __VA_ARGS__;      \
  BENCHMARK_TEMPLATE(FUNC, 8, 65536)->Name(#FUNC "/P:8/C:64K") __VA_ARGS__;    \
  BENCHMARK_TEMPLATE(FUNC, 64, 4096)->Name(#FUNC "/P:64/C:4K") __VA_ARGS__;    \
  BENCHMARK_TEMPLATE(FUNC, 64, 65536)->Name(#FUNC "/P:64/C:64K") __VA_ARGS__;  \
  BENCHMARK_TEMPLATE(FUNC, 256, 4096)->Name(#FUNC "/P:256/C:4K") __VA_ARGS__;  \
  BENCHMARK_TEMPLATE(FUNC, 256, 65536)->Name(#FUNC "/P:256/C:64K") __VA_ARGS__

// 1. 单线程
REGISTER_MATRIX(BM_RingBuffer_WriteRead);
REGISTER_MATRIX(BM_RingBuffer_BatchRead);

// 2. 多生产者
BENCHMARK_TEMPLATE(BM_RingBuffer_MultiProducer, 8)->ThreadRange(2, 8)->UseRealTime();
BENCHMARK_TEMPLATE(BM_RingBuffer_MultiProducer, 64)->ThreadRange(2, 8)->UseRealTime();

BENCHMARK_MAIN();
