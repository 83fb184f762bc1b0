#include <benchmark/benchmark.h>
#include <lull/lull.hpp>
#include <chrono>

using namespace lull;
using namespace std::chrono_literals;

// Cost of accepting a value: supersede the previous task and schedule a new one
static void BM_accept_burst(benchmark::State& state) {
  virtual_clock clk;
  subject<int> src;
  volatile int sink = 0;

  auto sub = (src.as_observable()
    | debounce_latest(10ms, clk, [&](int v){ sink = v; }))
    .subscribe({});

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      benchmark::DoNotOptimize(i);
      src.on_next(i);
    }
    clk.advance_by(10ms);
    benchmark::DoNotOptimize(sink);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_accept_burst)->Arg(100)->Arg(1000)->Arg(10000);

// Every value survives its quiet period and runs
static void BM_spaced_values(benchmark::State& state) {
  virtual_clock clk;
  subject<int> src;
  volatile int sink = 0;

  auto sub = (src.as_observable()
    | debounce_latest(1ms, clk, [&](int v){ sink = v; }))
    .subscribe([&](int v){ benchmark::DoNotOptimize(v); });

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      src.on_next(i);
      clk.advance_by(1ms);
    }
    benchmark::DoNotOptimize(sink);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_spaced_values)->Arg(100)->Arg(1000);

// Asynchronous actions: each new value cancels the running effect
static void BM_effect_cancel(benchmark::State& state) {
  virtual_clock clk;
  subject<int> src;

  auto sub = (src.as_observable()
    | debounce_latest(1ms, clk, [&](int){ return delay(5ms, clk); }))
    .subscribe({});

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      src.on_next(i);
      clk.advance_by(2ms);
    }
    clk.advance_by(10ms);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_effect_cancel)->Arg(100)->Arg(1000);

// Raw scheduling throughput of the virtual clock
static void BM_virtual_clock_schedule(benchmark::State& state) {
  virtual_clock clk;
  int fired = 0;

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      clk.schedule_after(std::chrono::milliseconds(i % 7), [&]{ ++fired; }).release();
    }
    clk.advance_by(10ms);
    benchmark::DoNotOptimize(fired);
  }
}
BENCHMARK(BM_virtual_clock_schedule)->Arg(100)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
