#include "mxwsort/exporter.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/json_io.hpp"
#include "mxwsort/logging.hpp"
#include "mxwsort/npy_io.hpp"
#include "mxwsort/preprocessing.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <vector>

namespace mxwsort {

const char* to_string(SampleDtype dtype) {
    switch (dtype) {
        case SampleDtype::Int16: return "int16";
        case SampleDtype::Float32: return "float32";
    }
    return "unknown";
}

size_t dtype_size(SampleDtype dtype) {
    switch (dtype) {
        case SampleDtype::Int16: return sizeof(int16_t);
        case SampleDtype::Float32: return sizeof(float);
    }
    return 0;
}

size_t chunk_frames(double fs, double chunk_duration_s) {
    const long long frames = std::llround(chunk_duration_s * fs);
    return frames > 0 ? static_cast<size_t>(frames) : 1;
}

Json::Value RunMetadata::to_json() const {
    Json::Value j(Json::objectValue);
    j["h5"] = h5.string();
    j["stream"] = stream;
    j["fs_hz"] = fs_hz;
    j["start_s"] = start_s;
    j["dur_s"] = dur_s ? Json::Value(*dur_s) : Json::Value(Json::nullValue);
    j["bp_min_hz"] = bp_min_hz;
    j["bp_max_frac_nyq"] = bp_max_frac_nyq;
    j["n_chan"] = static_cast<Json::UInt64>(n_chan);
    return j;
}

// ============================================================================
// Exporter
// ============================================================================

Exporter::Exporter(const ExportConfig& config)
    : config_(config) {}

ExportResult Exporter::run(const PreprocessingChain& chain,
                           const RunMetadata& meta,
                           const std::filesystem::path& out_dir) const {
    ExportResult result;
    result.traces = out_dir / config_.traces_file;
    result.probe = out_dir / config_.probe_file;
    result.channel_xy = out_dir / config_.channel_xy_file;
    result.meta = out_dir / config_.meta_file;
    result.num_frames = chain.num_frames();
    result.num_channels = chain.num_channels();

    result.num_chunks = write_traces(chain, result.traces);

    const ChannelGeometry& geometry = chain.channel_geometry();
    write_json(result.probe, probe_json(geometry));

    std::vector<double> xy;
    xy.reserve(geometry.size() * 2);
    for (const auto& pos : geometry) {
        xy.push_back(pos.x);
        xy.push_back(pos.y);
    }
    save_npy(result.channel_xy, make_npy<double>(xy, {geometry.size(), 2}));

    write_json(result.meta, meta.to_json());

    logger()->info("Exported {} frames x {} channels ({}) to {}",
                   result.num_frames, result.num_channels,
                   to_string(config_.dtype), result.traces.string());
    return result;
}

size_t Exporter::write_traces(const PreprocessingChain& chain,
                              const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("Cannot create trace file: " + path.string());
    }

    const size_t total = chain.num_frames();
    const size_t step = chunk_frames(chain.sampling_rate(), config_.chunk_duration_s);
    const size_t num_chunks = (total + step - 1) / step;

    std::vector<int16_t> scratch;
    size_t chunk = 0;
    for (size_t start = 0; start < total; start += step, ++chunk) {
        const size_t end = std::min(start + step, total);
        const TraceBlock block = chain.read(start, end);
        const float* samples = block.data();
        const size_t count = static_cast<size_t>(block.size());

        if (config_.dtype == SampleDtype::Int16) {
            scratch.resize(count);
            for (size_t i = 0; i < count; ++i) {
                const long v = std::lround(samples[i]);
                scratch[i] = static_cast<int16_t>(std::clamp<long>(
                    v, std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max()));
            }
            out.write(reinterpret_cast<const char*>(scratch.data()),
                      static_cast<std::streamsize>(count * sizeof(int16_t)));
        } else {
            out.write(reinterpret_cast<const char*>(samples),
                      static_cast<std::streamsize>(count * sizeof(float)));
        }

        if (!out) {
            throw IoError("Failed writing trace file " + path.string() + " at frame " +
                          std::to_string(start));
        }
        logger()->debug("Exported chunk {}/{}: frames [{}, {})", chunk + 1, num_chunks, start, end);
    }

    out.close();
    if (!out) {
        throw IoError("Failed flushing trace file " + path.string());
    }
    return num_chunks;
}

Json::Value Exporter::probe_json(const ChannelGeometry& geometry) {
    Json::Value chan_map(Json::arrayValue);
    Json::Value xc(Json::arrayValue);
    Json::Value yc(Json::arrayValue);
    Json::Value kcoords(Json::arrayValue);

    for (size_t i = 0; i < geometry.size(); ++i) {
        chan_map.append(static_cast<Json::UInt64>(i));
        xc.append(geometry[i].x);
        yc.append(geometry[i].y);
        kcoords.append(0);
    }

    Json::Value probe(Json::objectValue);
    probe["chanMap"] = chan_map;
    probe["xc"] = xc;
    probe["yc"] = yc;
    probe["kcoords"] = kcoords;
    probe["n_chan"] = static_cast<Json::UInt64>(geometry.size());
    return probe;
}

}  // namespace mxwsort
