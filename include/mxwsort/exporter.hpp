#pragma once

#include "types.hpp"

#include <json/json.h>

#include <filesystem>
#include <optional>
#include <string>

namespace mxwsort {

class PreprocessingChain;

/// Sample type of the exported binary
enum class SampleDtype {
    Int16,
    Float32
};

const char* to_string(SampleDtype dtype);
size_t dtype_size(SampleDtype dtype);

struct ExportConfig {
    SampleDtype dtype = SampleDtype::Int16;
    double chunk_duration_s = 1.0;   // Frames materialized per write, caps peak memory

    std::string traces_file = "traces.bin";
    std::string probe_file = "ks4_probe.json";
    std::string channel_xy_file = "channel_xy.npy";
    std::string meta_file = "meta.json";
};

/**
 * @brief Everything needed to reproduce an export
 */
struct RunMetadata {
    std::filesystem::path h5;
    std::string stream;
    double fs_hz = 0.0;
    double start_s = 0.0;
    std::optional<double> dur_s;     // null in the sidecar = full recording
    double bp_min_hz = 0.0;
    double bp_max_frac_nyq = 0.0;
    size_t n_chan = 0;

    Json::Value to_json() const;
};

struct ExportResult {
    std::filesystem::path traces;
    std::filesystem::path probe;
    std::filesystem::path channel_xy;
    std::filesystem::path meta;

    size_t num_frames = 0;
    size_t num_channels = 0;
    size_t num_chunks = 0;
};

/// Frames per chunk: round(chunk_duration_s * fs), at least one
size_t chunk_frames(double fs, double chunk_duration_s);

/**
 * @brief Materializes a preprocessing chain for the spike-sort engine
 *
 * Writes into one directory:
 *   - traces.bin      frame-major [frames x channels] samples, no header
 *   - ks4_probe.json  {chanMap, xc, yc, kcoords, n_chan}
 *   - channel_xy.npy  float64 (n_chan, 2)
 *   - meta.json       RunMetadata
 *
 * Samples are streamed chunk by chunk in frame order. Int16 output is
 * rounded to nearest and saturated at the type limits.
 */
class Exporter {
public:
    explicit Exporter(const ExportConfig& config = {});

    /**
     * @brief Write all four files into out_dir (which must exist)
     * @throws IoError if a file cannot be written
     */
    ExportResult run(const PreprocessingChain& chain,
                     const RunMetadata& meta,
                     const std::filesystem::path& out_dir) const;

    /// Stream traces only; returns the number of chunks written
    size_t write_traces(const PreprocessingChain& chain,
                        const std::filesystem::path& path) const;

    static Json::Value probe_json(const ChannelGeometry& geometry);

    const ExportConfig& config() const { return config_; }

private:
    ExportConfig config_;
};

}  // namespace mxwsort
