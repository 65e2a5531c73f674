#include <benchmark/benchmark.h>
#include <mxwsort/bandpass_filter.hpp>

#include <random>
#include <vector>

using namespace mxwsort;

namespace {

std::vector<double> noise(size_t n) {
    std::vector<double> x(n);
    std::mt19937 gen(42);
    std::normal_distribution<double> dist(0.0, 10.0);
    for (auto& v : x) v = dist(gen);
    return x;
}

}  // namespace

static void BM_Bandpass_Streaming(benchmark::State& state) {
    ButterworthBandpass filter;
    const size_t n = static_cast<size_t>(state.range(0));
    auto input = noise(n);
    std::vector<double> buffer(n);

    for (auto _ : state) {
        buffer = input;
        filter.process_buffer(buffer);
        benchmark::DoNotOptimize(buffer.data());
    }

    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Bandpass_Streaming)->Range(1024, 65536);

static void BM_Bandpass_ZeroPhase(benchmark::State& state) {
    ButterworthBandpass filter;
    const size_t n = static_cast<size_t>(state.range(0));
    auto input = noise(n);
    std::vector<double> buffer(n);

    for (auto _ : state) {
        buffer = input;
        filter.filter_zero_phase(buffer);
        benchmark::DoNotOptimize(buffer.data());
    }

    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Bandpass_ZeroPhase)->Range(1024, 65536);

static void BM_Bandpass_Design(benchmark::State& state) {
    ButterworthBandpass::Config config;
    for (auto _ : state) {
        ButterworthBandpass filter(config);
        benchmark::DoNotOptimize(filter);
    }
}
BENCHMARK(BM_Bandpass_Design);

BENCHMARK_MAIN();
