#include "mxwsort/qc_analyzer.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/json_io.hpp"
#include "mxwsort/logging.hpp"
#include "mxwsort/plot_renderer.hpp"
#include "mxwsort/spike_sorter.hpp"

#include <map>
#include <random>

namespace mxwsort {

namespace {

std::optional<NpyArray> load_optional(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    return load_npy(path);
}

}  // namespace

// ============================================================================
// SpikeSortOutput
// ============================================================================

SpikeSortOutput SpikeSortOutput::load(const std::filesystem::path& ks_dir) {
    auto times = load_optional(ks_dir / SPIKE_TIMES_FILE);
    auto clusters = load_optional(ks_dir / SPIKE_CLUSTERS_FILE);
    if (!times || !clusters) {
        throw MissingOutputError("Missing " + std::string(SPIKE_TIMES_FILE) + " or " +
                                 SPIKE_CLUSTERS_FILE + " in " + ks_dir.string());
    }

    SpikeSortOutput out;
    out.spike_times = times->as<int64_t>();
    out.spike_clusters = clusters->as<int64_t>();
    if (out.spike_times.size() != out.spike_clusters.size()) {
        throw IoError("Spike output in " + ks_dir.string() + " has " +
                      std::to_string(out.spike_times.size()) + " times but " +
                      std::to_string(out.spike_clusters.size()) + " cluster labels");
    }

    if (auto amps = load_optional(ks_dir / AMPLITUDES_FILE)) {
        out.amplitudes = amps->as<double>();
    }
    out.spike_positions = load_optional(ks_dir / SPIKE_POSITIONS_FILE);
    return out;
}

std::optional<SpikeSortOutput::Positions> SpikeSortOutput::positions_xy() const {
    if (!spike_positions || spike_positions->ndim() != 2) {
        return std::nullopt;
    }
    const size_t rows = spike_positions->shape[0];
    const size_t cols = spike_positions->shape[1];
    if (cols < 2 || rows < num_spikes()) {
        return std::nullopt;
    }

    const std::vector<double> flat = spike_positions->as<double>();
    Positions pos;
    pos.x.resize(rows);
    pos.y.resize(rows);
    for (size_t i = 0; i < rows; ++i) {
        pos.x[i] = flat[i * cols];
        pos.y[i] = flat[i * cols + 1];
    }
    return pos;
}

// ============================================================================
// Summary
// ============================================================================

Json::Value QcSummary::to_json(size_t first_units) const {
    Json::Value j(Json::objectValue);
    j["n_units"] = static_cast<Json::UInt64>(n_units);
    j["n_spikes"] = static_cast<Json::UInt64>(n_spikes);
    j["duration_s"] = duration_s;
    j["fs_hz"] = fs_hz;
    j["has_amplitudes"] = has_amplitudes;
    j["has_spike_positions"] = has_spike_positions;

    // An array keeps ascending unit order; jsoncpp sorts object keys as strings
    Json::Value rates(Json::arrayValue);
    const size_t n = std::min(first_units, unit_rates.size());
    for (size_t i = 0; i < n; ++i) {
        Json::Value entry(Json::objectValue);
        entry["unit"] = static_cast<Json::Int64>(unit_rates[i].unit);
        entry["rate_hz"] = unit_rates[i].rate_hz;
        rates.append(entry);
    }
    j["unit_firing_rate_hz_first10"] = rates;
    return j;
}

QcSummary summarize(const SpikeSortOutput& output, double fs_hz,
                    std::optional<double> duration_s) {
    QcSummary summary;
    summary.n_spikes = output.num_spikes();
    summary.fs_hz = fs_hz;
    summary.has_amplitudes = output.amplitudes.has_value();
    summary.has_spike_positions = output.spike_positions.has_value();

    if (duration_s) {
        summary.duration_s = *duration_s;
    } else if (!output.spike_times.empty()) {
        const int64_t last = *std::max_element(output.spike_times.begin(), output.spike_times.end());
        summary.duration_s = static_cast<double>(last) / fs_hz;
    }

    // Ordered map: ascending unit id regardless of label order in the file
    std::map<int64_t, size_t> counts;
    for (int64_t unit : output.spike_clusters) {
        ++counts[unit];
    }

    summary.n_units = counts.size();
    summary.unit_rates.reserve(counts.size());
    for (const auto& [unit, count] : counts) {
        const double rate = summary.duration_s > 0.0
            ? static_cast<double>(count) / summary.duration_s
            : 0.0;
        summary.unit_rates.push_back({unit, count, rate});
    }
    return summary;
}

// ============================================================================
// Subsampling
// ============================================================================

PlotSelection select_for_plots(const SpikeSortOutput& output, const QcConfig& config) {
    std::mt19937_64 rng(config.seed);
    PlotSelection selection;

    std::map<int64_t, std::vector<size_t>> spikes_of;
    for (size_t i = 0; i < output.spike_clusters.size(); ++i) {
        spikes_of[output.spike_clusters[i]].push_back(i);
    }

    std::vector<int64_t> units;
    units.reserve(spikes_of.size());
    for (const auto& entry : spikes_of) {
        units.push_back(entry.first);
    }

    for (size_t idx : sample_indices(units.size(), config.max_units_raster, rng)) {
        selection.raster_units.push_back(units[idx]);
    }

    for (int64_t unit : selection.raster_units) {
        const auto& all = spikes_of[unit];
        std::vector<size_t> chosen;
        for (size_t idx : sample_indices(all.size(), config.max_spikes_per_unit, rng)) {
            chosen.push_back(all[idx]);
        }
        selection.raster_spikes.push_back(std::move(chosen));
    }

    selection.scatter_spikes = sample_indices(output.num_spikes(), config.max_scatter_points, rng);
    return selection;
}

// ============================================================================
// QcAnalyzer
// ============================================================================

QcAnalyzer::QcAnalyzer(std::shared_ptr<PlotRenderer> renderer, const QcConfig& config)
    : renderer_(std::move(renderer))
    , config_(config) {}

QcReport QcAnalyzer::run(const std::filesystem::path& ks_dir,
                         const std::filesystem::path& qc_dir,
                         double fs_hz,
                         std::optional<double> duration_s) const {
    std::error_code ec;
    std::filesystem::create_directories(qc_dir, ec);
    if (ec) {
        throw IoError("Cannot create " + qc_dir.string() + ": " + ec.message());
    }

    const SpikeSortOutput output = SpikeSortOutput::load(ks_dir);

    QcReport report;
    report.summary = summarize(output, fs_hz, duration_s);
    report.summary_file = qc_dir / SUMMARY_FILE;
    write_json(report.summary_file, report.summary.to_json(config_.first_units_reported));

    logger()->info("QC: {} units, {} spikes over {:.2f} s",
                   report.summary.n_units, report.summary.n_spikes, report.summary.duration_s);

    if (!renderer_) {
        return report;
    }

    const PlotSelection sel = select_for_plots(output, config_);

    std::vector<double> t_s(output.num_spikes());
    for (size_t i = 0; i < t_s.size(); ++i) {
        t_s[i] = static_cast<double>(output.spike_times[i]) / fs_hz;
    }

    // Raster
    ScatterPlot raster;
    raster.title = "Raster (subsampled)";
    raster.x_label = "Time (s)";
    raster.y_label = "Unit (subset)";
    for (size_t row = 0; row < sel.raster_units.size(); ++row) {
        for (size_t spike : sel.raster_spikes[row]) {
            raster.x.push_back(t_s[spike]);
            raster.y.push_back(static_cast<double>(row));
        }
    }
    report.plots.push_back(renderer_->render_scatter(raster, qc_dir / "raster"));

    auto positions = output.positions_xy();
    if (!positions) {
        if (output.spike_positions) {
            logger()->warn("Skipping position plots: {} in {} is not an (N, 2) array",
                           SPIKE_POSITIONS_FILE, ks_dir.string());
        }
        return report;
    }

    // Spike positions
    ScatterPlot scatter;
    scatter.title = "Spike positions (subsampled)";
    scatter.x_label = "x (um)";
    scatter.y_label = "y (um)";
    for (size_t i : sel.scatter_spikes) {
        scatter.x.push_back(positions->x[i]);
        scatter.y.push_back(positions->y[i]);
    }
    report.plots.push_back(renderer_->render_scatter(scatter, qc_dir / "spike_positions"));

    // Drift: time vs depth, optionally sized by amplitude
    ScatterPlot drift;
    drift.title = "Drift scatter (subsampled)";
    drift.x_label = "Time (s)";
    drift.y_label = "y (um)";
    for (size_t i : sel.scatter_spikes) {
        drift.x.push_back(t_s[i]);
        drift.y.push_back(positions->y[i]);
    }
    if (output.amplitudes_match() && !output.amplitudes->empty()) {
        const auto& amp = *output.amplitudes;
        auto [mn, mx] = std::minmax_element(amp.begin(), amp.end());
        const double ptp = *mx - *mn;
        for (size_t i : sel.scatter_spikes) {
            drift.sizes.push_back(2.0 + 8.0 * (amp[i] - *mn) / (ptp + 1e-9));
        }
        report.amplitude_sized = true;
    }
    report.plots.push_back(renderer_->render_scatter(drift, qc_dir / "drift_scatter"));
    report.positions_plotted = true;

    return report;
}

}  // namespace mxwsort
