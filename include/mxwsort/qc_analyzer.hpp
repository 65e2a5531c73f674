#pragma once

#include "npy_io.hpp"

#include <json/json.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace mxwsort {

class PlotRenderer;

struct QcConfig {
    size_t max_units_raster = 80;
    size_t max_spikes_per_unit = 500;
    size_t max_scatter_points = 200000;
    uint64_t seed = 0;
    size_t first_units_reported = 10;
};

/**
 * @brief Arrays written by the spike-sort engine
 *
 * spike_times and spike_clusters are flattened on load (the engine stores
 * times as (N, 1)). Ascending time order is assumed, not verified.
 */
struct SpikeSortOutput {
    std::vector<int64_t> spike_times;      // Sample indices
    std::vector<int64_t> spike_clusters;   // Unit id per spike
    std::optional<std::vector<double>> amplitudes;
    std::optional<NpyArray> spike_positions;

    /**
     * @throws MissingOutputError if spike_times.npy or spike_clusters.npy is absent
     * @throws IoError if an array cannot be parsed or the two lengths differ
     */
    static SpikeSortOutput load(const std::filesystem::path& ks_dir);

    size_t num_spikes() const { return spike_times.size(); }

    struct Positions {
        std::vector<double> x;
        std::vector<double> y;
    };

    /// Per-spike x/y; std::nullopt unless positions are an (N, >=2) array with N >= spike count
    std::optional<Positions> positions_xy() const;

    /// Amplitude scaling applies only when there is one amplitude per spike
    bool amplitudes_match() const {
        return amplitudes && amplitudes->size() == spike_times.size();
    }
};

struct UnitRate {
    int64_t unit = 0;
    size_t spike_count = 0;
    double rate_hz = 0.0;
};

/**
 * @brief Summary statistics of one sorted well
 */
struct QcSummary {
    size_t n_units = 0;
    size_t n_spikes = 0;
    double duration_s = 0.0;
    double fs_hz = 0.0;
    bool has_amplitudes = false;
    bool has_spike_positions = false;
    std::vector<UnitRate> unit_rates;   // Every unit, ascending id

    /// unit_firing_rate_hz_first10 is an array of {unit, rate_hz} for the
    /// first first_units entries of unit_rates, in ascending unit order
    Json::Value to_json(size_t first_units = 10) const;
};

/**
 * @brief Derive the summary
 *
 * Duration is duration_s when given, else the last spike time (0 without
 * spikes). Rates are 0 when the duration is 0.
 */
QcSummary summarize(const SpikeSortOutput& output, double fs_hz,
                    std::optional<double> duration_s = std::nullopt);

/**
 * @brief Spikes chosen for plotting
 *
 * All choices come from one generator seeded with QcConfig::seed, drawn in a
 * fixed order (units, then spikes of each selected unit, then scatter points),
 * so identical inputs always give identical indices.
 */
struct PlotSelection {
    std::vector<int64_t> raster_units;                  // Ascending
    std::vector<std::vector<size_t>> raster_spikes;     // Per raster unit, ascending spike indices
    std::vector<size_t> scatter_spikes;                 // Ascending spike indices
};

PlotSelection select_for_plots(const SpikeSortOutput& output, const QcConfig& config);

/**
 * @brief Sample k of 0..n-1 without replacement, returned ascending
 *
 * Returns all indices when k >= n.
 */
template <class Rng>
std::vector<size_t> sample_indices(size_t n, size_t k, Rng& rng);

struct QcReport {
    QcSummary summary;
    std::filesystem::path summary_file;
    std::vector<std::filesystem::path> plots;
    bool positions_plotted = false;
    bool amplitude_sized = false;
};

/**
 * @brief Turns spike-sort output into qc_summary.json and diagnostic plots
 *
 * Writes qc_summary.json and a raster; spike-position and drift plots follow
 * when per-spike positions are present and well formed. A null renderer
 * writes the summary only.
 */
class QcAnalyzer {
public:
    static constexpr const char* SUMMARY_FILE = "qc_summary.json";

    explicit QcAnalyzer(std::shared_ptr<PlotRenderer> renderer, const QcConfig& config = {});

    /**
     * @throws MissingOutputError if a required engine output is absent
     * @throws IoError if an output cannot be written
     */
    QcReport run(const std::filesystem::path& ks_dir,
                 const std::filesystem::path& qc_dir,
                 double fs_hz,
                 std::optional<double> duration_s = std::nullopt) const;

    const QcConfig& config() const { return config_; }

private:
    std::shared_ptr<PlotRenderer> renderer_;
    QcConfig config_;
};

// ============================================================================
// Template Implementation
// ============================================================================

template <class Rng>
std::vector<size_t> sample_indices(size_t n, size_t k, Rng& rng) {
    std::vector<size_t> pool(n);
    for (size_t i = 0; i < n; ++i) pool[i] = i;
    if (k >= n) return pool;

    // Partial Fisher-Yates: the first k slots end up a uniform sample
    for (size_t i = 0; i < k; ++i) {
        const size_t j = i + static_cast<size_t>(rng() % (n - i));
        std::swap(pool[i], pool[j]);
    }
    pool.resize(k);
    std::sort(pool.begin(), pool.end());
    return pool;
}

}  // namespace mxwsort
