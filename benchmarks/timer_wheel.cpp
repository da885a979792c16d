#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdint>
#include <vector>

#include "mdr/core/timer_wheel.hpp"

using namespace std::chrono_literals;

// ============================================================================
// 1. schedule + cancel
// ============================================================================

static void BM_TimerWheel_ScheduleCancel(benchmark::State &state) {
  mdr::TimerWheel wheel(1ms, 1024);
  std::uint64_t token = 0;
  std::int64_t deadline = 0;

  for ([[maybe_unused]] auto _ : state) {
    deadline = (deadline + 997'000) % 2'000'000'000;
    auto id = wheel.schedule(deadline, ++token);
    bool ok = wheel.cancel(id);
    benchmark::DoNotOptimize(ok);
  }
  state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// 2. 周期性定时器 (心跳)：N 个定时器，每次到期后重新调度
// 每轮 advance 一个 tick
// ============================================================================

static void BM_TimerWheel_PeriodicAdvance(benchmark::State &state) {
  const auto timers = static_cast<std::uint64_t>(state.range(0));
  constexpr std::int64_t TICK = 1'000'000;
  constexpr std::int64_t PERIOD = 100 * TICK;

  mdr::TimerWheel wheel(std::chrono::nanoseconds(TICK), 1024);
  for (std::uint64_t t = 0; t < timers; ++t) {
    (void)wheel.schedule(static_cast<std::int64_t>(t % 100) * TICK + PERIOD, t);
  }

  std::int64_t now = 0;
  std::int64_t fired = 0;
  for ([[maybe_unused]] auto _ : state) {
    now += TICK;
    fired += wheel.advance(now, [&](std::uint64_t token, mdr::TimerWheel::TimerId) {
      (void)wheel.schedule(now + PERIOD, token);
    });
  }
  state.counters["fired"] = benchmark::Counter(static_cast<double>(fired));
  state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// 3. 长时间空闲后一次性推进多圈
// ============================================================================

static void BM_TimerWheel_SparseAdvance(benchmark::State &state) {
  constexpr std::int64_t TICK = 1'000'000;
  mdr::TimerWheel wheel(std::chrono::nanoseconds(TICK), 1024);
  std::int64_t now = 0;

  for ([[maybe_unused]] auto _ : state) {
    (void)wheel.schedule(now + 5000 * TICK, 1);
    now += 5000 * TICK;
    int n = wheel.advance(now, [](std::uint64_t, mdr::TimerWheel::TimerId) {});
    benchmark::DoNotOptimize(n);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TimerWheel_ScheduleCancel);
BENCHMARK(BM_TimerWheel_PeriodicAdvance)->Arg(16)->Arg(256)->Arg(4096);
BENCHMARK(BM_TimerWheel_SparseAdvance);

BENCHMARK_MAIN();
