#pragma once

#include <json/json.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace mxwsort {

// Output files of the engine that QC consumes
inline constexpr const char* SPIKE_TIMES_FILE = "spike_times.npy";
inline constexpr const char* SPIKE_CLUSTERS_FILE = "spike_clusters.npy";
inline constexpr const char* AMPLITUDES_FILE = "amplitudes.npy";
inline constexpr const char* SPIKE_POSITIONS_FILE = "spike_positions.npy";

/**
 * @brief Fully specified settings for one spike-sort run
 */
struct SorterSettings {
    std::filesystem::path filename;      // Exported traces
    std::filesystem::path probe_path;    // Probe sidecar
    std::filesystem::path results_dir;
    double fs = 0.0;
    size_t n_chan_bin = 0;
    size_t batch_size = 60000;
    double highpass_cutoff = 1.0;

    Json::Value to_json() const;
};

/**
 * @brief Boundary to an external spike-sorting engine
 *
 * run() blocks until the engine finishes. Completion is judged afterwards by
 * spike_sort_complete() alone.
 */
class SpikeSorter {
public:
    virtual ~SpikeSorter() = default;

    /// @throws SpikeSortError if the engine reports failure
    virtual void run(const SorterSettings& settings) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Runs Kilosort4 through a Python bridge script
 *
 * Writes ks4_settings.json into the results directory and invokes
 *
 *   <python> <bridge_script> <results_dir>/ks4_settings.json
 *
 * synchronously. There is no timeout.
 */
class Kilosort4Runner : public SpikeSorter {
public:
    struct Config {
        std::string python = "python3";
        std::filesystem::path bridge_script;   // Empty selects default_bridge_script()
        std::vector<std::pair<std::string, std::string>> environment;  // Prepended as NAME=value
    };

    static constexpr const char* SETTINGS_FILE = "ks4_settings.json";

    Kilosort4Runner();
    explicit Kilosort4Runner(Config config);

    /**
     * @throws IoError if the settings cannot be written or the shell cannot start
     * @throws SpikeSortError on a non-zero exit status or a signal
     */
    void run(const SorterSettings& settings) override;

    std::string name() const override { return "kilosort4"; }

    /// Shell command for a settings file, with every argument quoted
    std::string command_line(const std::filesystem::path& settings_file) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

/**
 * @brief Bridge script used when none is configured
 *
 * $MXWSORT_KS4_BRIDGE when set, else tools/run_kilosort4.py of the source
 * tree the library was built from. Independent of the working directory.
 */
std::filesystem::path default_bridge_script();

/// True when both required engine outputs exist in results_dir
bool spike_sort_complete(const std::filesystem::path& results_dir);

}  // namespace mxwsort
