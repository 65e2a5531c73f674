#include "mxwsort/orchestrator.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/logging.hpp"
#include "mxwsort/plot_renderer.hpp"
#include "mxwsort/preprocessing.hpp"
#include "mxwsort/raw_store.hpp"
#include "mxwsort/spike_sorter.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace mxwsort {

const char* to_string(WellState state) {
    switch (state) {
        case WellState::Pending: return "pending";
        case WellState::Skip: return "skip";
        case WellState::DryRunPreview: return "dry-run";
        case WellState::Running: return "running";
        case WellState::Done: return "done";
        case WellState::Failed: return "failed";
    }
    return "unknown";
}

WellPaths WellPaths::for_stream(const std::filesystem::path& out_root,
                                const std::string& stream,
                                const ExportConfig& export_config) {
    WellPaths p;
    p.well_dir = out_root / stream;
    p.preprocessed_dir = p.well_dir / "preprocessed";
    p.ks4_dir = p.well_dir / "ks4";
    p.qc_dir = p.well_dir / "qc";
    p.traces = p.preprocessed_dir / export_config.traces_file;
    p.probe = p.preprocessed_dir / export_config.probe_file;
    p.channel_xy = p.preprocessed_dir / export_config.channel_xy_file;
    p.meta = p.preprocessed_dir / export_config.meta_file;
    return p;
}

size_t BatchReport::count(WellState state) const {
    return static_cast<size_t>(std::count_if(wells.begin(), wells.end(),
        [state](const WellOutcome& w) { return w.state == state; }));
}

void BatchReport::append(BatchReport&& other) {
    files.insert(files.end(), other.files.begin(), other.files.end());
    for (auto& w : other.wells) {
        wells.push_back(std::move(w));
    }
}

// ============================================================================
// Work Discovery
// ============================================================================

namespace {

bool is_recording_file(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == ".h5";
}

std::string format_wells(const std::vector<int>& wells) {
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < wells.size(); ++i) {
        if (i) ss << ", ";
        ss << wells[i];
    }
    ss << ']';
    return ss.str();
}

void ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IoError("Cannot create " + dir.string() + ": " + ec.message());
    }
}

}  // namespace

std::vector<std::filesystem::path> find_recordings_recursive(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root, ec), end;
    if (ec) {
        throw IoError("Cannot list " + root.string() + ": " + ec.message());
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw IoError("Cannot list " + root.string() + ": " + ec.message());
        }
        if (is_recording_file(*it)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::filesystem::path> find_recordings_flat(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec), end;
    if (ec) {
        throw IoError("Cannot list " + dir.string() + ": " + ec.message());
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw IoError("Cannot list " + dir.string() + ": " + ec.message());
        }
        if (is_recording_file(*it)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// Orchestrator Implementation
// ============================================================================

struct Orchestrator::Impl {
    PipelineConfig config;
    RunOptions options;
    std::shared_ptr<SpikeSorter> sorter;
    Exporter exporter;
    QcAnalyzer qc;

    Impl(const PipelineConfig& cfg, const RunOptions& opts,
         std::shared_ptr<SpikeSorter> s, std::shared_ptr<PlotRenderer> renderer,
         const QcConfig& qc_config, const ExportConfig& export_config)
        : config(cfg)
        , options(opts)
        , sorter(std::move(s))
        , exporter(export_config)
        , qc(renderer ? std::move(renderer) : std::make_shared<SvgPlotRenderer>(), qc_config) {}

    void preview(WellOutcome& job) const {
        auto log = logger();
        log->info("[RUN] {} {} -> {} (dry-run)", job.source.string(), job.stream,
                  job.paths.well_dir.string());

        auto duration = probe_duration_seconds(job.source, job.stream);
        if (duration) {
            job.probed_duration_s = *duration;
            log->info("  (dry-run) recording duration: {:.3f} s", *duration);
        } else {
            log->info("  (dry-run) recording duration: unknown");
            log->debug("  (dry-run) duration probe failed: {}", duration.error());
        }

        log->info("  (dry-run) would write: {}", job.paths.traces.string());
        log->info("  (dry-run) would write: {}", job.paths.probe.string());
        log->info("  (dry-run) would write: {}", job.paths.channel_xy.string());
        log->info("  (dry-run) would write: {}", job.paths.meta.string());
        log->info("  (dry-run) would run {} into: {}", sorter->name(), job.paths.ks4_dir.string());
        log->info("  (dry-run) would write qc into: {}", job.paths.qc_dir.string());
    }

    void execute(WellOutcome& job) {
        logger()->info("[RUN] {} {} -> {}", job.source.string(), job.stream,
                       job.paths.well_dir.string());

        ensure_directory(job.paths.preprocessed_dir);
        ensure_directory(job.paths.ks4_dir);
        ensure_directory(job.paths.qc_dir);

        std::shared_ptr<RecordingHandle> recording;
        {
            MXWSORT_TIMED_STAGE(job.timings, "open");
            recording = std::make_shared<RecordingHandle>(job.source, job.stream);
        }
        logger()->debug("{} {}: {} layout, {} channels, {} frames at {} Hz",
                        job.source.string(), job.stream,
                        to_string(recording->info().group_layout),
                        recording->num_channels(), recording->num_frames(),
                        recording->sampling_rate());

        std::optional<PreprocessingChain> chain;
        {
            MXWSORT_TIMED_STAGE(job.timings, "preprocess");
            chain.emplace(PreprocessingChain::standard(recording, config));
        }
        logger()->debug("{} {}: exporting source frames [{}, {})", job.source.string(), job.stream,
                        chain->source_range().start, chain->source_range().end);

        const double fs = chain->sampling_rate();
        const size_t n_chan = chain->num_channels();

        RunMetadata meta;
        meta.h5 = job.source;
        meta.stream = job.stream;
        meta.fs_hz = fs;
        meta.start_s = config.start_s;
        meta.dur_s = config.dur_s;
        meta.bp_min_hz = config.bp_min_hz;
        meta.bp_max_frac_nyq = config.bp_max_frac_nyq;
        meta.n_chan = n_chan;

        {
            MXWSORT_TIMED_STAGE(job.timings, "export");
            exporter.run(*chain, meta, job.paths.preprocessed_dir);
        }

        // Duration of the exported window, when one was requested
        std::optional<double> processed_s;
        if (config.dur_s) {
            processed_s = static_cast<double>(chain->num_frames()) / fs;
        }

        // The engine reads only the exported files
        chain.reset();
        recording->close();
        recording.reset();

        SorterSettings settings;
        settings.filename = job.paths.traces;
        settings.probe_path = job.paths.probe;
        settings.results_dir = job.paths.ks4_dir;
        settings.fs = fs;
        settings.n_chan_bin = n_chan;
        settings.batch_size = config.ks4_batch_size;
        settings.highpass_cutoff = config.ks4_highpass_cutoff_hz;
        {
            MXWSORT_TIMED_STAGE(job.timings, "sort");
            sorter->run(settings);
        }

        {
            MXWSORT_TIMED_STAGE(job.timings, "qc");
            qc.run(job.paths.ks4_dir, job.paths.qc_dir, fs, processed_s);
        }
    }
};

Orchestrator::Orchestrator(const PipelineConfig& config,
                           const RunOptions& options,
                           std::shared_ptr<SpikeSorter> sorter,
                           std::shared_ptr<PlotRenderer> renderer,
                           const QcConfig& qc_config,
                           const ExportConfig& export_config)
{
    if (!config.is_valid()) {
        std::ostringstream ss;
        ss << "Invalid pipeline config: start_s=" << config.start_s
           << ", dur_s=" << (config.dur_s ? std::to_string(*config.dur_s) : std::string("full"))
           << ", bp_min_hz=" << config.bp_min_hz
           << ", bp_max_frac_nyq=" << config.bp_max_frac_nyq
           << ", ks4_batch_size=" << config.ks4_batch_size;
        throw ConfigValidationError(ss.str());
    }
    if (!sorter) {
        throw std::invalid_argument("Orchestrator needs a spike sorter");
    }
    impl_ = std::make_unique<Impl>(config, options, std::move(sorter), std::move(renderer),
                                   qc_config, export_config);
}

Orchestrator::~Orchestrator() = default;
Orchestrator::Orchestrator(Orchestrator&&) noexcept = default;
Orchestrator& Orchestrator::operator=(Orchestrator&&) noexcept = default;

std::vector<int> Orchestrator::resolve_wells(const std::filesystem::path& h5,
                                             const WellSelection& selection) const {
    switch (selection.mode) {
        case WellSelection::Mode::Single:
        case WellSelection::Mode::Explicit:
            return selection.wells;
        case WellSelection::Mode::Auto:
            break;
    }

    WellDetection detection = detect_wells(h5);
    if (detection.fell_back) {
        logger()->warn("Well detection failed for {} ({}); using default wells {}",
                       h5.string(), detection.reason, format_wells(detection.wells));
    } else {
        logger()->info("Auto-detected {} wells: {}", detection.wells.size(),
                       format_wells(detection.wells));
    }
    return detection.wells;
}

WellOutcome Orchestrator::run_well(const std::filesystem::path& h5,
                                   const std::filesystem::path& out_root,
                                   int well) {
    WellOutcome job;
    job.source = h5;
    job.well = well;
    job.stream = stream_name(well);
    job.paths = WellPaths::for_stream(out_root, job.stream, impl_->exporter.config());

    if (impl_->options.skip_existing && spike_sort_complete(job.paths.ks4_dir)) {
        job.state = WellState::Skip;
        logger()->info("[SKIP] {} {} ({} outputs exist)", h5.string(), job.stream,
                       impl_->sorter->name());
        return job;
    }

    if (impl_->options.dry_run) {
        job.state = WellState::DryRunPreview;
        impl_->preview(job);
        return job;
    }

    job.state = WellState::Running;
    try {
        impl_->execute(job);
    } catch (const std::exception& e) {
        job.state = WellState::Failed;
        logger()->error("[FAIL] {} {}: {}", h5.string(), job.stream, e.what());
        logger()->debug("{} {} timings: {}", h5.string(), job.stream, job.timings.format());
        throw;
    }

    job.state = WellState::Done;
    logger()->info("[DONE] {} {} in {:.1f} s", h5.string(), job.stream,
                   to_milliseconds(job.timings.total()) / 1000.0);
    logger()->debug("{} {} timings: {}", h5.string(), job.stream, job.timings.format());
    return job;
}

BatchReport Orchestrator::run_file(const std::filesystem::path& h5,
                                   const std::filesystem::path& out_root,
                                   const WellSelection& selection) {
    BatchReport report;
    report.files.push_back(h5);
    for (int well : resolve_wells(h5, selection)) {
        report.wells.push_back(run_well(h5, out_root, well));
    }
    return report;
}

BatchReport Orchestrator::run_recursive(const std::filesystem::path& root,
                                        const std::filesystem::path& out_root,
                                        const WellSelection& selection) {
    BatchReport report;
    const auto files = find_recordings_recursive(root);
    if (files.empty()) {
        logger()->info("No .h5 files found under {}", root.string());
        return report;
    }

    logger()->info("Found {} .h5 file(s) under {}:", files.size(), root.string());
    for (const auto& f : files) {
        logger()->info("  {}", f.string());
    }

    for (const auto& file : files) {
        const auto file_out = out_root / file.lexically_relative(root).parent_path();
        if (!impl_->options.dry_run) {
            ensure_directory(file_out);
        }
        report.append(run_file(file, file_out, selection));
    }
    return report;
}

BatchReport Orchestrator::run_flat(const std::filesystem::path& dir,
                                   const std::filesystem::path& out_root,
                                   const WellSelection& selection) {
    BatchReport report;
    const auto files = find_recordings_flat(dir);
    if (files.empty()) {
        logger()->info("No .h5 files found in {}", dir.string());
        return report;
    }

    logger()->info("Found {} .h5 file(s) in {}:", files.size(), dir.string());
    for (const auto& f : files) {
        logger()->info("  {}", f.string());
    }

    for (const auto& file : files) {
        const auto file_out = out_root / file.stem();
        if (!impl_->options.dry_run) {
            ensure_directory(file_out);
        }
        report.append(run_file(file, file_out, selection));
    }
    return report;
}

const PipelineConfig& Orchestrator::config() const {
    return impl_->config;
}

const RunOptions& Orchestrator::options() const {
    return impl_->options;
}

}  // namespace mxwsort
