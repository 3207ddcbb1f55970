#include <benchmark/benchmark.h>
#include <hdr/hdr_histogram.h>
#include <chrono>
#include <cstdint>
#include "relay/signal.hpp"

using namespace relay;

using BenchSignal   = relay::signal<int>;
using BenchListener = BenchSignal::listener_type;

// Wall-clock latency of one call, recorded in nanoseconds.
static void RecordCalls(benchmark::State& state, BenchSignal& sig, const BenchListener& sender) {
    hdr_histogram* hist;
    hdr_init(1, 10000000, 3, &hist);

    for (auto _ : state) {
        for (int i = 0; i < 10000; ++i) {
            auto start = std::chrono::steady_clock::now();
            sig.call(sender);
            auto end = std::chrono::steady_clock::now();
            hdr_record_value(hist, std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        }
    }

    state.counters["P50_ns"]   = static_cast<double>(hdr_value_at_percentile(hist, 50.0));
    state.counters["P99_ns"]   = static_cast<double>(hdr_value_at_percentile(hist, 99.0));
    state.counters["P99.9_ns"] = static_cast<double>(hdr_value_at_percentile(hist, 99.9));

    hdr_close(hist);
}

static void BM_Signal_Call_Latency_HDR(benchmark::State& state) {
    BenchSignal sig{"latency"};
    for (int64_t i = 0; i < state.range(0); ++i) {
        sig.add([](const BenchListener& sender) { benchmark::DoNotOptimize(&sender); }, static_cast<int>(i));
    }
    RecordCalls(state, sig, 42);
}
BENCHMARK(BM_Signal_Call_Latency_HDR)
    ->Arg(1)
    ->Arg(64)
    ->Unit(benchmark::kMicrosecond);

// A sender nobody listens on still pays for the full walk.
static void BM_Signal_Unmatched_Latency_HDR(benchmark::State& state) {
    BenchSignal sig{"latency"};
    for (int i = 0; i < 64; ++i) {
        sig.add([](const BenchListener& sender) { benchmark::DoNotOptimize(&sender); }, 0, i);
    }
    RecordCalls(state, sig, -1);
}
BENCHMARK(BM_Signal_Unmatched_Latency_HDR)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
