#include <benchmark/benchmark.h>
#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>
#include "relay/signal.hpp"

using namespace relay;

using BenchSignal   = relay::signal<int>;
using BenchListener = BenchSignal::listener_type;

static void BM_Signal_Dispatch_Overhead(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    BenchSignal sig{"bench"};
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        sig.add([](const BenchListener& sender) { benchmark::DoNotOptimize(&sender); }, static_cast<int>(i % 16));
    }

    for (auto _ : state) {
        sig.call(any);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Dispatch_Overhead)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

// Only one slot in eight listens on the sender; the walk is still O(n).
static void BM_Signal_Filtered_Dispatch(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    BenchSignal sig{"bench"};
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        sig.add([](const BenchListener& sender) { benchmark::DoNotOptimize(&sender); }, 0, static_cast<int>(i % 8));
    }

    for (auto _ : state) {
        sig.call(3);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Filtered_Dispatch)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

// Copy-on-write insertion: cost grows with the number of registered slots.
static void BM_Signal_Insert(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    for (auto _ : state) {
        state.PauseTiming();
        BenchSignal sig{"bench"};
        for (size_t i = 0; i < SLOTS_NUM; ++i) {
            sig.add([](const BenchListener&) {}, static_cast<int>(i % 16));
        }
        state.ResumeTiming();

        auto slot = sig.add([](const BenchListener&) {}, 8);
        benchmark::DoNotOptimize(slot.id());
    }
}
BENCHMARK(BM_Signal_Insert)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000);

// Dispatch from every pool thread at once while nothing writes.
static void BM_Signal_Parallel_Dispatch(benchmark::State& state) {
    exec::static_thread_pool pool{4};
    auto sch = pool.get_scheduler();

    BenchSignal sig{"bench"};
    for (int i = 0; i < 100; ++i) {
        sig.add([](const BenchListener& sender) { benchmark::DoNotOptimize(&sender); }, i);
    }

    auto burst = [&] {
        return stdexec::schedule(sch) | stdexec::then([&] {
            for (int i = 0; i < 100; ++i) {
                sig.call(any);
            }
        });
    };

    for (auto _ : state) {
        auto done = stdexec::sync_wait(stdexec::when_all(burst(), burst(), burst(), burst()));
        benchmark::DoNotOptimize(done);
    }
    state.SetItemsProcessed(state.iterations() * 4 * 100);
}
BENCHMARK(BM_Signal_Parallel_Dispatch)->UseRealTime();

BENCHMARK_MAIN();
