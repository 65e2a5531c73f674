#pragma once

#include "config.hpp"
#include "exporter.hpp"
#include "qc_analyzer.hpp"
#include "stage_timer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mxwsort {

class PlotRenderer;
class SpikeSorter;

// ============================================================================
// Per-Well State Machine
// ============================================================================

/**
 * @brief Lifecycle of one well
 *
 *   Pending -> Skip               outputs exist and skip_existing is set
 *   Pending -> DryRunPreview      dry_run is set; no filesystem mutation
 *   Pending -> Running -> Done
 *                      -> Failed  any stage threw; the error propagates
 */
enum class WellState {
    Pending,
    Skip,
    DryRunPreview,
    Running,
    Done,
    Failed
};

const char* to_string(WellState state);

/// Output locations of one well below an output root
struct WellPaths {
    std::filesystem::path well_dir;
    std::filesystem::path preprocessed_dir;
    std::filesystem::path ks4_dir;
    std::filesystem::path qc_dir;

    std::filesystem::path traces;
    std::filesystem::path probe;
    std::filesystem::path channel_xy;
    std::filesystem::path meta;

    static WellPaths for_stream(const std::filesystem::path& out_root,
                                const std::string& stream,
                                const ExportConfig& export_config = {});
};

struct WellOutcome {
    std::filesystem::path source;
    int well = 0;
    std::string stream;
    WellPaths paths;
    WellState state = WellState::Pending;
    StageTimings timings;
    std::optional<double> probed_duration_s;   // Dry run only
};

struct BatchReport {
    std::vector<std::filesystem::path> files;
    std::vector<WellOutcome> wells;

    size_t count(WellState state) const;
    void append(BatchReport&& other);
};

// ============================================================================
// Work Discovery
// ============================================================================

/// All *.h5 files below root at any depth, in sorted path order
std::vector<std::filesystem::path> find_recordings_recursive(const std::filesystem::path& root);

/// *.h5 files directly inside dir, in sorted name order
std::vector<std::filesystem::path> find_recordings_flat(const std::filesystem::path& dir);

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * @brief Drives files and wells through read, preprocess, export, sort and QC
 *
 * Strictly sequential: files in sorted order, wells in the order selected,
 * stages in fixed order. A failing well is logged, marked Failed and its
 * exception rethrown, which ends the batch.
 *
 * Example:
 * @code
 *   auto sorter = std::make_shared<Kilosort4Runner>();
 *   Orchestrator orch(PipelineConfig{}, RunOptions{}, sorter);
 *   orch.run_file("data.raw.h5", "out", WellSelection::automatic());
 * @endcode
 */
class Orchestrator {
public:
    /**
     * @param renderer QC plot backend; null selects SvgPlotRenderer
     * @throws ConfigValidationError if config.is_valid() is false
     * @throws std::invalid_argument if sorter is null
     */
    Orchestrator(const PipelineConfig& config,
                 const RunOptions& options,
                 std::shared_ptr<SpikeSorter> sorter,
                 std::shared_ptr<PlotRenderer> renderer = nullptr,
                 const QcConfig& qc_config = {},
                 const ExportConfig& export_config = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) noexcept;
    Orchestrator& operator=(Orchestrator&&) noexcept;

    /// Process the selected wells of one file into out_root/wellNNN/
    BatchReport run_file(const std::filesystem::path& h5,
                         const std::filesystem::path& out_root,
                         const WellSelection& selection);

    /// Every *.h5 below root; outputs mirror each file's relative directory
    BatchReport run_recursive(const std::filesystem::path& root,
                              const std::filesystem::path& out_root,
                              const WellSelection& selection);

    /// Every *.h5 directly in dir; outputs go to out_root/<file stem>/
    BatchReport run_flat(const std::filesystem::path& dir,
                         const std::filesystem::path& out_root,
                         const WellSelection& selection);

    /// One well through the state machine
    WellOutcome run_well(const std::filesystem::path& h5,
                         const std::filesystem::path& out_root,
                         int well);

    /// Wells to process for a selection, in processing order
    std::vector<int> resolve_wells(const std::filesystem::path& h5,
                                   const WellSelection& selection) const;

    const PipelineConfig& config() const;
    const RunOptions& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace mxwsort
