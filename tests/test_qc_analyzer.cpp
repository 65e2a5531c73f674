#include <gtest/gtest.h>
#include <mxwsort/errors.hpp>
#include <mxwsort/json_io.hpp>
#include <mxwsort/plot_renderer.hpp>
#include <mxwsort/qc_analyzer.hpp>

#include "test_fixtures.hpp"

#include <fstream>
#include <iterator>
#include <numeric>
#include <random>
#include <set>

using namespace mxwsort;

namespace {

/// Keeps every plot in memory instead of drawing it
class CapturingRenderer : public PlotRenderer {
public:
    std::vector<std::pair<std::string, ScatterPlot>> plots;

    std::filesystem::path render_scatter(const ScatterPlot& plot,
                                         const std::filesystem::path& path_stem) override {
        plots.emplace_back(path_stem.filename().string(), plot);
        return path_stem.string() + ".cap";
    }

    const ScatterPlot* find(const std::string& name) const {
        for (const auto& [n, p] : plots) {
            if (n == name) return &p;
        }
        return nullptr;
    }
};

SpikeSortOutput make_output(std::vector<int64_t> times, std::vector<int64_t> clusters) {
    SpikeSortOutput out;
    out.spike_times = std::move(times);
    out.spike_clusters = std::move(clusters);
    return out;
}

}  // namespace

class QcAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ks_dir_ = dir_ / "kilosort4";
        qc_dir_ = dir_ / "qc";
        std::filesystem::create_directories(ks_dir_);
    }

    /// Fake engine outputs: 30 spikes at 3*i, units i % 3, amplitudes i + 1, positions (i, 2i)
    void write_engine_outputs(size_t num_spikes = 30) {
        test::FakeSpikeSorter sorter;
        sorter.num_spikes = num_spikes;
        SorterSettings settings;
        settings.results_dir = ks_dir_;
        sorter.run(settings);
    }

    test::TempDir dir_;
    std::filesystem::path ks_dir_;
    std::filesystem::path qc_dir_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(QcAnalyzerTest, MissingRequiredOutputThrows) {
    EXPECT_THROW(SpikeSortOutput::load(ks_dir_), MissingOutputError);

    write_engine_outputs();
    std::filesystem::remove(ks_dir_ / SPIKE_CLUSTERS_FILE);
    EXPECT_THROW(SpikeSortOutput::load(ks_dir_), MissingOutputError);

    QcAnalyzer analyzer(nullptr);
    EXPECT_THROW(analyzer.run(ks_dir_, qc_dir_, 1000.0), MissingOutputError);
}

TEST_F(QcAnalyzerTest, LoadFlattensAndReadsOptionalArrays) {
    write_engine_outputs();
    SpikeSortOutput out = SpikeSortOutput::load(ks_dir_);

    ASSERT_EQ(out.num_spikes(), 30u);
    EXPECT_EQ(out.spike_times[4], 12);
    EXPECT_EQ(out.spike_clusters[4], 1);
    ASSERT_TRUE(out.amplitudes.has_value());
    EXPECT_DOUBLE_EQ((*out.amplitudes)[4], 5.0);
    EXPECT_TRUE(out.amplitudes_match());

    auto pos = out.positions_xy();
    ASSERT_TRUE(pos.has_value());
    EXPECT_DOUBLE_EQ(pos->x[7], 7.0);
    EXPECT_DOUBLE_EQ(pos->y[7], 14.0);
}

TEST_F(QcAnalyzerTest, LoadWithoutOptionalArrays) {
    write_engine_outputs();
    std::filesystem::remove(ks_dir_ / AMPLITUDES_FILE);
    std::filesystem::remove(ks_dir_ / SPIKE_POSITIONS_FILE);

    SpikeSortOutput out = SpikeSortOutput::load(ks_dir_);
    EXPECT_FALSE(out.amplitudes.has_value());
    EXPECT_FALSE(out.spike_positions.has_value());
    EXPECT_FALSE(out.positions_xy().has_value());
    EXPECT_FALSE(out.amplitudes_match());
}

TEST_F(QcAnalyzerTest, MismatchedLengthsThrow) {
    write_engine_outputs();
    const std::vector<int32_t> short_clusters = {0, 1};
    save_npy(ks_dir_ / SPIKE_CLUSTERS_FILE, make_npy<int32_t>(short_clusters, {2}));
    EXPECT_THROW(SpikeSortOutput::load(ks_dir_), IoError);
}

TEST(SpikePositionsTest, MalformedShapesAreRejected) {
    SpikeSortOutput out = make_output({0, 1, 2}, {0, 0, 0});

    const std::vector<double> flat = {1, 2, 3};
    out.spike_positions = make_npy<double>(flat, {3});
    EXPECT_FALSE(out.positions_xy().has_value());

    out.spike_positions = make_npy<double>(flat, {3, 1});
    EXPECT_FALSE(out.positions_xy().has_value());

    const std::vector<double> two_rows = {1, 2, 3, 4};
    out.spike_positions = make_npy<double>(two_rows, {2, 2});
    EXPECT_FALSE(out.positions_xy().has_value());

    const std::vector<double> wide = {1, 2, 9, 3, 4, 9, 5, 6, 9};
    out.spike_positions = make_npy<double>(wide, {3, 3});
    auto pos = out.positions_xy();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->x, (std::vector<double>{1, 3, 5}));
    EXPECT_EQ(pos->y, (std::vector<double>{2, 4, 6}));
}

// ============================================================================
// Summary
// ============================================================================

TEST(QcSummaryTest, CountsUnitsAscending) {
    SpikeSortOutput out = make_output({10, 20, 30, 40, 50, 60}, {7, 2, 7, 7, 2, 4});
    QcSummary s = summarize(out, 10.0, 2.0);

    EXPECT_EQ(s.n_units, 3u);
    EXPECT_EQ(s.n_spikes, 6u);
    EXPECT_DOUBLE_EQ(s.duration_s, 2.0);
    EXPECT_DOUBLE_EQ(s.fs_hz, 10.0);
    ASSERT_EQ(s.unit_rates.size(), 3u);
    EXPECT_EQ(s.unit_rates[0].unit, 2);
    EXPECT_EQ(s.unit_rates[1].unit, 4);
    EXPECT_EQ(s.unit_rates[2].unit, 7);
    EXPECT_EQ(s.unit_rates[2].spike_count, 3u);
    EXPECT_DOUBLE_EQ(s.unit_rates[2].rate_hz, 1.5);
}

TEST(QcSummaryTest, DurationFallsBackToLastSpike) {
    SpikeSortOutput out = make_output({100, 500, 2000}, {0, 1, 0});
    QcSummary s = summarize(out, 1000.0);
    EXPECT_DOUBLE_EQ(s.duration_s, 2.0);
    EXPECT_DOUBLE_EQ(s.unit_rates[0].rate_hz, 1.0);
}

TEST(QcSummaryTest, RatesSumToSpikesOverDuration) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int64_t> unit(0, 20);
    std::vector<int64_t> times;
    std::vector<int64_t> clusters;
    for (int64_t i = 0; i < 1000; ++i) {
        times.push_back(i * 7);
        clusters.push_back(unit(rng));
    }
    SpikeSortOutput out = make_output(times, clusters);
    QcSummary s = summarize(out, 20000.0, 3.5);

    double total = 0.0;
    size_t spikes = 0;
    for (const auto& r : s.unit_rates) {
        total += r.rate_hz;
        spikes += r.spike_count;
    }
    EXPECT_EQ(spikes, 1000u);
    EXPECT_NEAR(total, 1000.0 / 3.5, 1e-9);
}

TEST(QcSummaryTest, ZeroSpikes) {
    SpikeSortOutput out = make_output({}, {});
    QcSummary s = summarize(out, 20000.0);
    EXPECT_EQ(s.n_units, 0u);
    EXPECT_EQ(s.n_spikes, 0u);
    EXPECT_DOUBLE_EQ(s.duration_s, 0.0);
    EXPECT_TRUE(s.unit_rates.empty());

    Json::Value j = s.to_json();
    EXPECT_TRUE(j["unit_firing_rate_hz_first10"].isArray());
    EXPECT_EQ(j["unit_firing_rate_hz_first10"].size(), 0u);
}

TEST(QcSummaryTest, ZeroDurationGivesZeroRates) {
    SpikeSortOutput out = make_output({0, 0}, {1, 1});
    QcSummary s = summarize(out, 1000.0);
    ASSERT_EQ(s.unit_rates.size(), 1u);
    EXPECT_DOUBLE_EQ(s.unit_rates[0].rate_hz, 0.0);
}

TEST(QcSummaryTest, JsonReportsFirstUnitsOnly) {
    std::vector<int64_t> times;
    std::vector<int64_t> clusters;
    for (int64_t u = 0; u < 15; ++u) {
        times.push_back(u);
        clusters.push_back(100 - u);
    }
    QcSummary s = summarize(make_output(times, clusters), 1000.0, 1.0);
    Json::Value j = s.to_json(10);

    EXPECT_EQ(j["n_units"].asUInt64(), 15u);
    EXPECT_EQ(j["n_spikes"].asUInt64(), 15u);
    EXPECT_DOUBLE_EQ(j["duration_s"].asDouble(), 1.0);
    EXPECT_FALSE(j["has_amplitudes"].asBool());
    EXPECT_FALSE(j["has_spike_positions"].asBool());

    const Json::Value& rates = j["unit_firing_rate_hz_first10"];
    ASSERT_TRUE(rates.isArray());
    ASSERT_EQ(rates.size(), 10u);
    // Lowest ids are 86..95
    for (Json::ArrayIndex i = 0; i < rates.size(); ++i) {
        EXPECT_EQ(rates[i]["unit"].asInt64(), 86 + static_cast<int64_t>(i));
        EXPECT_DOUBLE_EQ(rates[i]["rate_hz"].asDouble(), 1.0);
    }
}

TEST(QcSummaryTest, JsonKeepsNumericUnitOrderAcrossDigitCounts) {
    SpikeSortOutput out = make_output({1, 2, 3, 4, 5, 6}, {100, 5, 12, 5, 100, 100});
    QcSummary s = summarize(out, 1000.0, 1.0);

    // Write and reread, so the order is the one on disk
    test::TempDir dir;
    write_json(dir / "summary.json", s.to_json());
    const Json::Value rates = read_json(dir / "summary.json")["unit_firing_rate_hz_first10"];

    ASSERT_EQ(rates.size(), 3u);
    EXPECT_EQ(rates[0]["unit"].asInt64(), 5);
    EXPECT_EQ(rates[1]["unit"].asInt64(), 12);
    EXPECT_EQ(rates[2]["unit"].asInt64(), 100);
    EXPECT_DOUBLE_EQ(rates[0]["rate_hz"].asDouble(), 2.0);
    EXPECT_DOUBLE_EQ(rates[1]["rate_hz"].asDouble(), 1.0);
    EXPECT_DOUBLE_EQ(rates[2]["rate_hz"].asDouble(), 3.0);
}

// ============================================================================
// Subsampling
// ============================================================================

TEST(SampleIndicesTest, ReturnsSortedDistinctSubset) {
    std::mt19937_64 rng(0);
    auto idx = sample_indices(1000, 50, rng);
    ASSERT_EQ(idx.size(), 50u);
    EXPECT_TRUE(std::is_sorted(idx.begin(), idx.end()));
    EXPECT_EQ(std::set<size_t>(idx.begin(), idx.end()).size(), 50u);
    EXPECT_LT(idx.back(), 1000u);
}

TEST(SampleIndicesTest, ReturnsAllWhenNotEnough) {
    std::mt19937_64 rng(0);
    auto idx = sample_indices(5, 10, rng);
    EXPECT_EQ(idx, (std::vector<size_t>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(sample_indices(0, 3, rng).empty());
}

TEST(PlotSelectionTest, RespectsCapsAndIsDeterministic) {
    std::vector<int64_t> times;
    std::vector<int64_t> clusters;
    for (int64_t i = 0; i < 5000; ++i) {
        times.push_back(i);
        clusters.push_back(i % 120);
    }
    SpikeSortOutput out = make_output(times, clusters);

    QcConfig config;
    config.max_units_raster = 80;
    config.max_spikes_per_unit = 20;
    config.max_scatter_points = 1000;

    PlotSelection a = select_for_plots(out, config);
    PlotSelection b = select_for_plots(out, config);

    EXPECT_EQ(a.raster_units.size(), 80u);
    EXPECT_TRUE(std::is_sorted(a.raster_units.begin(), a.raster_units.end()));
    ASSERT_EQ(a.raster_spikes.size(), 80u);
    for (size_t row = 0; row < a.raster_units.size(); ++row) {
        EXPECT_EQ(a.raster_spikes[row].size(), 20u);
        for (size_t spike : a.raster_spikes[row]) {
            EXPECT_EQ(out.spike_clusters[spike], a.raster_units[row]);
        }
    }
    EXPECT_EQ(a.scatter_spikes.size(), 1000u);

    EXPECT_EQ(a.raster_units, b.raster_units);
    EXPECT_EQ(a.raster_spikes, b.raster_spikes);
    EXPECT_EQ(a.scatter_spikes, b.scatter_spikes);

    config.seed = 1;
    PlotSelection c = select_for_plots(out, config);
    EXPECT_NE(a.scatter_spikes, c.scatter_spikes);
}

// ============================================================================
// Analyzer
// ============================================================================

TEST_F(QcAnalyzerTest, NullRendererWritesSummaryOnly) {
    write_engine_outputs();
    QcAnalyzer analyzer(nullptr);
    QcReport report = analyzer.run(ks_dir_, qc_dir_, 1000.0, 0.09);

    EXPECT_EQ(report.summary_file, qc_dir_ / QcAnalyzer::SUMMARY_FILE);
    EXPECT_TRUE(report.plots.empty());
    EXPECT_FALSE(report.positions_plotted);

    Json::Value j = read_json(report.summary_file);
    EXPECT_EQ(j["n_units"].asUInt64(), 3u);
    EXPECT_EQ(j["n_spikes"].asUInt64(), 30u);
    EXPECT_DOUBLE_EQ(j["duration_s"].asDouble(), 0.09);
    EXPECT_TRUE(j["has_amplitudes"].asBool());
    EXPECT_TRUE(j["has_spike_positions"].asBool());
    const Json::Value& first = j["unit_firing_rate_hz_first10"][0];
    EXPECT_EQ(first["unit"].asInt64(), 0);
    EXPECT_NEAR(first["rate_hz"].asDouble(), 10.0 / 0.09, 1e-9);
}

TEST_F(QcAnalyzerTest, RendersAllPlotsWithPositions) {
    write_engine_outputs();
    auto renderer = std::make_shared<CapturingRenderer>();
    QcAnalyzer analyzer(renderer);
    QcReport report = analyzer.run(ks_dir_, qc_dir_, 1000.0);

    ASSERT_EQ(renderer->plots.size(), 3u);
    EXPECT_EQ(report.plots.size(), 3u);
    EXPECT_TRUE(report.positions_plotted);
    EXPECT_TRUE(report.amplitude_sized);

    const ScatterPlot* raster = renderer->find("raster");
    ASSERT_NE(raster, nullptr);
    EXPECT_EQ(raster->x.size(), 30u);
    EXPECT_DOUBLE_EQ(raster->marker_size, 1.0);
    EXPECT_TRUE(raster->sizes.empty());

    const ScatterPlot* positions = renderer->find("spike_positions");
    ASSERT_NE(positions, nullptr);
    ASSERT_EQ(positions->x.size(), 30u);
    for (size_t i = 0; i < positions->x.size(); ++i) {
        EXPECT_DOUBLE_EQ(positions->y[i], 2.0 * positions->x[i]);
    }

    const ScatterPlot* drift = renderer->find("drift_scatter");
    ASSERT_NE(drift, nullptr);
    ASSERT_EQ(drift->sizes.size(), 30u);
    // Amplitudes 1..30 map linearly onto marker sizes 2..10
    EXPECT_NEAR(*std::min_element(drift->sizes.begin(), drift->sizes.end()), 2.0, 1e-6);
    EXPECT_NEAR(*std::max_element(drift->sizes.begin(), drift->sizes.end()), 10.0, 1e-6);
    EXPECT_DOUBLE_EQ(drift->x[1], 3.0 / 1000.0);
}

TEST_F(QcAnalyzerTest, DriftUnsizedWithoutMatchingAmplitudes) {
    write_engine_outputs();
    const std::vector<float> few = {1.0f, 2.0f};
    save_npy(ks_dir_ / AMPLITUDES_FILE, make_npy<float>(few, {2}));

    auto renderer = std::make_shared<CapturingRenderer>();
    QcReport report = QcAnalyzer(renderer).run(ks_dir_, qc_dir_, 1000.0);

    EXPECT_TRUE(report.positions_plotted);
    EXPECT_FALSE(report.amplitude_sized);
    const ScatterPlot* drift = renderer->find("drift_scatter");
    ASSERT_NE(drift, nullptr);
    EXPECT_TRUE(drift->sizes.empty());
}

TEST_F(QcAnalyzerTest, MalformedPositionsSkipPositionPlots) {
    write_engine_outputs();
    const std::vector<double> flat(30, 1.0);
    save_npy(ks_dir_ / SPIKE_POSITIONS_FILE, make_npy<double>(flat, {30}));

    auto renderer = std::make_shared<CapturingRenderer>();
    QcReport report = QcAnalyzer(renderer).run(ks_dir_, qc_dir_, 1000.0);

    EXPECT_EQ(renderer->plots.size(), 1u);
    EXPECT_NE(renderer->find("raster"), nullptr);
    EXPECT_FALSE(report.positions_plotted);
    EXPECT_TRUE(report.summary.has_spike_positions);
}

TEST_F(QcAnalyzerTest, SvgRendererWritesFiles) {
    write_engine_outputs();
    QcAnalyzer analyzer(std::make_shared<SvgPlotRenderer>());
    QcReport report = analyzer.run(ks_dir_, qc_dir_, 1000.0);

    ASSERT_EQ(report.plots.size(), 3u);
    for (const auto& plot : report.plots) {
        EXPECT_EQ(plot.extension(), ".svg");
        ASSERT_TRUE(std::filesystem::exists(plot)) << plot;
        std::ifstream f(plot);
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        EXPECT_NE(text.find("<svg"), std::string::npos);
        EXPECT_NE(text.find("</svg>"), std::string::npos);
    }
    EXPECT_TRUE(std::filesystem::exists(qc_dir_ / "raster.svg"));
    EXPECT_TRUE(std::filesystem::exists(qc_dir_ / "spike_positions.svg"));
    EXPECT_TRUE(std::filesystem::exists(qc_dir_ / "drift_scatter.svg"));
}

TEST(SvgPlotRendererTest, FullDeviceFailsWrite) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    test::TempDir dir;
    std::filesystem::create_symlink("/dev/full", dir / "plot.svg");

    ScatterPlot plot;
    plot.x = {0.0, 1.0};
    plot.y = {2.0, 3.0};
    EXPECT_THROW(SvgPlotRenderer().render_scatter(plot, dir / "plot"), IoError);
}

TEST_F(QcAnalyzerTest, SameInputsGiveIdenticalSummaryAndPlots) {
    write_engine_outputs();
    auto a = std::make_shared<CapturingRenderer>();
    auto b = std::make_shared<CapturingRenderer>();
    QcAnalyzer(a).run(ks_dir_, dir_ / "qc_a", 1000.0);
    QcAnalyzer(b).run(ks_dir_, dir_ / "qc_b", 1000.0);

    ASSERT_EQ(a->plots.size(), b->plots.size());
    for (size_t i = 0; i < a->plots.size(); ++i) {
        EXPECT_EQ(a->plots[i].second.x, b->plots[i].second.x);
        EXPECT_EQ(a->plots[i].second.y, b->plots[i].second.y);
    }

    auto text = [](const std::filesystem::path& p) {
        std::ifstream f(p);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    };
    EXPECT_EQ(text(dir_ / "qc_a" / QcAnalyzer::SUMMARY_FILE),
              text(dir_ / "qc_b" / QcAnalyzer::SUMMARY_FILE));
}
