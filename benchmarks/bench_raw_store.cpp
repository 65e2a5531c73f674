#include <benchmark/benchmark.h>
#include <mxwsort/config.hpp>
#include <mxwsort/preprocessing.hpp>
#include <mxwsort/raw_store.hpp>

#include "test_fixtures.hpp"

using namespace mxwsort;

namespace {

constexpr size_t NUM_CHANNELS = 256;
constexpr size_t NUM_SAMPLES = 40000;   // 2 s at 20 kHz

/// One planar and one interleaved file, written once per process
struct BenchFiles {
    test::TempDir dir;
    std::filesystem::path planar;
    std::filesystem::path interleaved;

    BenchFiles() {
        test::SyntheticWell w;
        w.channels = NUM_CHANNELS;
        w.samples = NUM_SAMPLES;
        w.fs = 20000.0;

        planar = dir / "planar.h5";
        test::write_recording_file(planar, {w});

        w.interleaved = true;
        interleaved = dir / "interleaved.h5";
        test::write_recording_file(interleaved, {w});
    }
};

BenchFiles& files() {
    static BenchFiles f;
    return f;
}

}  // namespace

static void BM_RawStore_ReadPlanar(benchmark::State& state) {
    RecordingHandle rec(files().planar, "well000");
    const size_t frames = static_cast<size_t>(state.range(0));

    size_t start = 0;
    for (auto _ : state) {
        TraceBlock block = rec.read_window(start, start + frames);
        benchmark::DoNotOptimize(block.data());
        start = (start + frames) % (NUM_SAMPLES - frames);
    }

    state.SetItemsProcessed(state.iterations() * frames * NUM_CHANNELS);
}
BENCHMARK(BM_RawStore_ReadPlanar)->Range(256, 16384);

static void BM_RawStore_ReadInterleaved(benchmark::State& state) {
    RecordingHandle rec(files().interleaved, "well000");
    const size_t frames = static_cast<size_t>(state.range(0));

    size_t start = 0;
    for (auto _ : state) {
        TraceBlock block = rec.read_window(start, start + frames);
        benchmark::DoNotOptimize(block.data());
        start = (start + frames) % (NUM_SAMPLES - frames);
    }

    state.SetItemsProcessed(state.iterations() * frames * NUM_CHANNELS);
}
BENCHMARK(BM_RawStore_ReadInterleaved)->Range(256, 16384);

static void BM_RawStore_ReadChannelSubset(benchmark::State& state) {
    RecordingHandle rec(files().planar, "well000");
    std::vector<size_t> channels;
    for (size_t ch = 0; ch < NUM_CHANNELS; ch += 8) {
        channels.push_back(ch);
    }

    for (auto _ : state) {
        TraceBlock block = rec.read_window(0, 4096, channels);
        benchmark::DoNotOptimize(block.data());
    }

    state.SetItemsProcessed(state.iterations() * 4096 * channels.size());
}
BENCHMARK(BM_RawStore_ReadChannelSubset);

static void BM_Preprocessing_StandardChain(benchmark::State& state) {
    auto rec = std::make_shared<RecordingHandle>(files().planar, "well000");
    PipelineConfig config;
    config.dur_s.reset();
    PreprocessingChain chain = PreprocessingChain::standard(rec, config);
    const size_t frames = static_cast<size_t>(state.range(0));

    for (auto _ : state) {
        TraceBlock block = chain.read(1000, 1000 + frames);
        benchmark::DoNotOptimize(block.data());
    }

    state.SetItemsProcessed(state.iterations() * frames * NUM_CHANNELS);
}
BENCHMARK(BM_Preprocessing_StandardChain)->Range(1024, 16384);

BENCHMARK_MAIN();
