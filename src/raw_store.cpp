#include "mxwsort/raw_store.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/hdf5_handle.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <variant>

namespace mxwsort {

const char* to_string(ArrayLayout layout) {
    switch (layout) {
        case ArrayLayout::Planar2D: return "planar-2d";
        case ArrayLayout::Interleaved1D: return "interleaved-1d";
    }
    return "unknown";
}

const char* to_string(GroupLayout layout) {
    switch (layout) {
        case GroupLayout::NestedRecording: return "nested";
        case GroupLayout::Direct: return "direct";
    }
    return "unknown";
}

namespace {

constexpr const char* MAPPING_PATH = "settings/mapping";
constexpr const char* SAMPLING_PATH = "settings/sampling";
constexpr const char* RAW_PATH = "groups/routed/raw";
constexpr const char* CHANNELS_PATH = "groups/routed/channels";

/// One row of settings/mapping; only the fields used here are converted
struct MappingRow {
    int32_t channel;
    double x;
    double y;
};

/// [channels x samples]
struct PlanarShape {
    size_t channels = 0;
    size_t samples = 0;
};

/// [samples * channels], frame-major
struct InterleavedShape {
    size_t channels = 0;
    size_t samples = 0;
};

using RawShape = std::variant<PlanarShape, InterleavedShape>;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

struct ResolvedGroup {
    h5::Handle group;
    GroupLayout layout = GroupLayout::Direct;
    std::string path;
};

std::string describe(const std::filesystem::path& source, const std::string& stream) {
    return source.string() + " [" + stream + "]";
}

h5::Handle open_read_only(const std::filesystem::path& path) {
    hid_t id = H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (id < 0) {
        throw IoError("Cannot open HDF5 file: " + path.string());
    }
    return h5::file(id);
}

std::vector<std::string> list_members(hid_t group) {
    H5G_info_t info{};
    if (H5Gget_info(group, &info) < 0) {
        throw IoError("Cannot list HDF5 group members");
    }

    std::vector<std::string> names;
    names.reserve(info.nlinks);
    for (hsize_t i = 0; i < info.nlinks; ++i) {
        ssize_t len = H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i,
                                         nullptr, 0, H5P_DEFAULT);
        if (len < 0) continue;
        std::string name(static_cast<size_t>(len) + 1, '\0');
        H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i,
                           name.data(), name.size(), H5P_DEFAULT);
        name.resize(static_cast<size_t>(len));
        names.push_back(std::move(name));
    }
    return names;
}

bool is_recording_group(hid_t group) {
    return h5::object_type(group, MAPPING_PATH) == H5I_DATASET
        && h5::object_type(group, SAMPLING_PATH) == H5I_DATASET
        && h5::object_type(group, RAW_PATH) == H5I_DATASET;
}

ResolvedGroup resolve_recording_group(hid_t file,
                                      const std::filesystem::path& source,
                                      const std::string& stream) {
    const std::string well_path = "wells/" + stream;
    if (h5::object_type(file, well_path) != H5I_GROUP) {
        throw LayoutResolutionError(
            "Stream group /" + well_path + " not found in " + source.string());
    }
    h5::Handle well = h5::group(H5Gopen2(file, well_path.c_str(), H5P_DEFAULT));
    if (!well) {
        throw IoError("Cannot open /" + well_path + " in " + source.string());
    }

    // Nested form first: the first rec* subgroup in name order
    std::vector<std::string> recs;
    for (auto& name : list_members(well.get())) {
        if (name.starts_with("rec") && h5::object_type(well.get(), name) == H5I_GROUP) {
            recs.push_back(std::move(name));
        }
    }
    std::sort(recs.begin(), recs.end());

    if (!recs.empty()) {
        h5::Handle rec = h5::group(H5Gopen2(well.get(), recs.front().c_str(), H5P_DEFAULT));
        if (rec && is_recording_group(rec.get())) {
            return {std::move(rec), GroupLayout::NestedRecording,
                    "/" + well_path + "/" + recs.front()};
        }
    }

    if (is_recording_group(well.get())) {
        return {std::move(well), GroupLayout::Direct, "/" + well_path};
    }

    throw LayoutResolutionError(
        "No recording found for " + describe(source, stream) +
        ": expected " + std::string(MAPPING_PATH) + ", " + SAMPLING_PATH + " and " + RAW_PATH +
        " under /" + well_path + "/rec* or directly under /" + well_path);
}

h5::Handle open_dataset(hid_t group, const char* path) {
    h5::Handle ds = h5::dataset(H5Dopen2(group, path, H5P_DEFAULT));
    if (!ds) {
        throw IoError(std::string("Cannot open dataset ") + path);
    }
    return ds;
}

size_t element_count(hid_t dataset) {
    h5::Handle space = h5::dataspace(H5Dget_space(dataset));
    hssize_t n = H5Sget_simple_extent_npoints(space.get());
    if (n < 0) {
        throw IoError("Cannot query dataset extent");
    }
    return static_cast<size_t>(n);
}

std::vector<MappingRow> read_mapping(hid_t group) {
    h5::Handle ds = open_dataset(group, MAPPING_PATH);
    h5::Handle file_type = h5::datatype(H5Dget_type(ds.get()));
    if (H5Tget_class(file_type.get()) != H5T_COMPOUND) {
        throw LayoutResolutionError("settings/mapping is not a compound table");
    }
    for (const char* field : {"channel", "x", "y"}) {
        if (H5Tget_member_index(file_type.get(), field) < 0) {
            throw LayoutResolutionError(
                std::string("settings/mapping has no '") + field + "' field");
        }
    }

    h5::Handle mem_type = h5::datatype(H5Tcreate(H5T_COMPOUND, sizeof(MappingRow)));
    H5Tinsert(mem_type.get(), "channel", HOFFSET(MappingRow, channel), H5T_NATIVE_INT32);
    H5Tinsert(mem_type.get(), "x", HOFFSET(MappingRow, x), H5T_NATIVE_DOUBLE);
    H5Tinsert(mem_type.get(), "y", HOFFSET(MappingRow, y), H5T_NATIVE_DOUBLE);

    std::vector<MappingRow> rows(element_count(ds.get()));
    if (!rows.empty() &&
        H5Dread(ds.get(), mem_type.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, rows.data()) < 0) {
        throw IoError("Failed to read settings/mapping");
    }
    return rows;
}

double read_sampling_rate(hid_t group) {
    h5::Handle ds = open_dataset(group, SAMPLING_PATH);
    std::vector<double> values(element_count(ds.get()));
    if (values.empty()) {
        throw LayoutResolutionError("settings/sampling is empty");
    }
    if (H5Dread(ds.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0) {
        throw IoError("Failed to read settings/sampling");
    }
    if (!(values.front() > 0.0)) {
        throw LayoutResolutionError(
            "settings/sampling must be positive, got " + std::to_string(values.front()));
    }
    return values.front();
}

std::vector<int64_t> read_channel_ids(hid_t group) {
    h5::Handle ds = open_dataset(group, CHANNELS_PATH);
    std::vector<int64_t> ids(element_count(ds.get()));
    if (!ids.empty() &&
        H5Dread(ds.get(), H5T_NATIVE_INT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, ids.data()) < 0) {
        throw IoError("Failed to read groups/routed/channels");
    }
    return ids;
}

SampleFormat read_sample_format(hid_t raw) {
    h5::Handle type = h5::datatype(H5Dget_type(raw));
    SampleFormat format;
    format.bits = H5Tget_size(type.get()) * 8;
    switch (H5Tget_class(type.get())) {
        case H5T_INTEGER:
            format.is_signed = H5Tget_sign(type.get()) == H5T_SGN_2;
            break;
        case H5T_FLOAT:
            format.is_float = true;
            format.is_signed = true;
            break;
        default:
            throw LayoutResolutionError("groups/routed/raw is neither integer nor float");
    }
    return format;
}

RawShape read_raw_shape(hid_t raw, size_t mapping_rows) {
    h5::Handle space = h5::dataspace(H5Dget_space(raw));
    int ndims = H5Sget_simple_extent_ndims(space.get());
    if (ndims != 1 && ndims != 2) {
        throw LayoutResolutionError(
            "groups/routed/raw must be 1D or 2D, found " + std::to_string(ndims) + " dimensions");
    }

    hsize_t dims[2] = {0, 0};
    H5Sget_simple_extent_dims(space.get(), dims, nullptr);

    if (ndims == 2) {
        return PlanarShape{static_cast<size_t>(dims[0]), static_cast<size_t>(dims[1])};
    }

    // Interleaved: sample count from the mapping table, channel count back from the length
    const size_t total = static_cast<size_t>(dims[0]);
    if (mapping_rows == 0) {
        throw LayoutResolutionError("Cannot infer sample count of 1D raw array: empty mapping");
    }
    const size_t samples = total / mapping_rows;
    if (samples == 0) {
        throw LayoutResolutionError(
            "1D raw array of length " + std::to_string(total) +
            " is shorter than one frame of " + std::to_string(mapping_rows) + " channels");
    }
    return InterleavedShape{total / samples, samples};
}

ChannelGeometry resolve_geometry(const std::vector<MappingRow>& mapping,
                                 const std::optional<std::vector<int64_t>>& channel_ids) {
    ChannelGeometry geometry;

    if (!channel_ids) {
        geometry.reserve(mapping.size());
        for (const auto& row : mapping) {
            geometry.push_back({row.x, row.y});
        }
        return geometry;
    }

    // The active list holds channel identifiers, not row indices
    std::unordered_map<int64_t, size_t> row_of;
    row_of.reserve(mapping.size());
    for (size_t i = 0; i < mapping.size(); ++i) {
        row_of.emplace(mapping[i].channel, i);
    }

    geometry.reserve(channel_ids->size());
    for (int64_t id : *channel_ids) {
        auto it = row_of.find(id);
        if (it == row_of.end()) {
            throw LayoutResolutionError(
                "Active channel id " + std::to_string(id) + " has no row in settings/mapping");
        }
        const auto& row = mapping[it->second];
        geometry.push_back({row.x, row.y});
    }
    return geometry;
}

}  // namespace

// ============================================================================
// RecordingHandle Implementation
// ============================================================================

struct RecordingHandle::Impl {
    // Declaration order matters: the file is released last
    h5::Handle file;
    h5::Handle group;
    h5::Handle raw;

    RecordingInfo info;
    RawShape shape;
    ChannelGeometry geometry;

    TraceBlock read_planar(const PlanarShape& s, size_t start, size_t frames) const {
        hsize_t offset[2] = {0, start};
        hsize_t count[2] = {s.channels, frames};

        h5::Handle file_space = h5::dataspace(H5Dget_space(raw.get()));
        H5Sselect_hyperslab(file_space.get(), H5S_SELECT_SET, offset, nullptr, count, nullptr);
        h5::Handle mem_space = h5::dataspace(H5Screate_simple(2, count, nullptr));

        // Column slice [channels x frames], transposed to [frames x channels]
        TraceBlock planar(s.channels, frames);
        if (H5Dread(raw.get(), H5T_NATIVE_FLOAT, mem_space.get(), file_space.get(),
                    H5P_DEFAULT, planar.data()) < 0) {
            throw IoError("Failed to read frames [" + std::to_string(start) + ", " +
                          std::to_string(start + frames) + ") of " +
                          describe(info.source, info.stream));
        }
        return planar.transpose();
    }

    TraceBlock read_interleaved(const InterleavedShape& s, size_t start, size_t frames) const {
        hsize_t offset[1] = {start * s.channels};
        hsize_t count[1] = {frames * s.channels};

        h5::Handle file_space = h5::dataspace(H5Dget_space(raw.get()));
        H5Sselect_hyperslab(file_space.get(), H5S_SELECT_SET, offset, nullptr, count, nullptr);
        h5::Handle mem_space = h5::dataspace(H5Screate_simple(1, count, nullptr));

        // Flat range is already frame-major
        TraceBlock block(frames, s.channels);
        if (H5Dread(raw.get(), H5T_NATIVE_FLOAT, mem_space.get(), file_space.get(),
                    H5P_DEFAULT, block.data()) < 0) {
            throw IoError("Failed to read frames [" + std::to_string(start) + ", " +
                          std::to_string(start + frames) + ") of " +
                          describe(info.source, info.stream));
        }
        return block;
    }
};

RecordingHandle::RecordingHandle(const std::filesystem::path& path, const std::string& stream)
    : impl_(std::make_unique<Impl>())
{
    h5::ErrorSilencer quiet;

    impl_->file = open_read_only(path);
    ResolvedGroup resolved = resolve_recording_group(impl_->file.get(), path, stream);
    impl_->group = std::move(resolved.group);
    impl_->raw = open_dataset(impl_->group.get(), RAW_PATH);

    const std::vector<MappingRow> mapping = read_mapping(impl_->group.get());

    std::optional<std::vector<int64_t>> channel_ids;
    if (h5::object_type(impl_->group.get(), CHANNELS_PATH) == H5I_DATASET) {
        channel_ids = read_channel_ids(impl_->group.get());
    }

    RecordingInfo& info = impl_->info;
    info.source = path;
    info.stream = stream;
    info.group_path = resolved.path;
    info.group_layout = resolved.layout;
    info.sampling_rate_hz = read_sampling_rate(impl_->group.get());
    info.format = read_sample_format(impl_->raw.get());

    impl_->shape = read_raw_shape(impl_->raw.get(), mapping.size());
    std::visit(overloaded{
        [&](const PlanarShape& s) {
            info.layout = ArrayLayout::Planar2D;
            info.num_channels = s.channels;
            info.num_frames = s.samples;
        },
        [&](const InterleavedShape& s) {
            info.layout = ArrayLayout::Interleaved1D;
            info.num_channels = s.channels;
            info.num_frames = s.samples;
        },
    }, impl_->shape);

    impl_->geometry = resolve_geometry(mapping, channel_ids);
    if (impl_->geometry.size() != info.num_channels) {
        throw LayoutResolutionError(
            "Geometry of " + describe(path, stream) + " has " +
            std::to_string(impl_->geometry.size()) + " positions for " +
            std::to_string(info.num_channels) + " raw channels");
    }
}

RecordingHandle::~RecordingHandle() = default;
RecordingHandle::RecordingHandle(RecordingHandle&&) noexcept = default;
RecordingHandle& RecordingHandle::operator=(RecordingHandle&&) noexcept = default;

TraceBlock RecordingHandle::read_window(size_t start_frame, size_t end_frame,
                                        std::span<const size_t> channels) const {
    if (!is_open()) {
        throw IoError("Read from closed recording " + describe(impl_->info.source, impl_->info.stream));
    }

    const RecordingInfo& info = impl_->info;
    if (start_frame > end_frame || end_frame > info.num_frames) {
        throw std::out_of_range(
            "Frame window [" + std::to_string(start_frame) + ", " + std::to_string(end_frame) +
            ") outside recording of " + std::to_string(info.num_frames) + " frames");
    }
    for (size_t ch : channels) {
        if (ch >= info.num_channels) {
            throw std::out_of_range(
                "Channel " + std::to_string(ch) + " outside recording of " +
                std::to_string(info.num_channels) + " channels");
        }
    }

    const size_t frames = end_frame - start_frame;
    if (frames == 0) {
        return TraceBlock(0, channels.empty() ? info.num_channels : channels.size());
    }

    h5::ErrorSilencer quiet;
    TraceBlock block = std::visit(overloaded{
        [&](const PlanarShape& s) { return impl_->read_planar(s, start_frame, frames); },
        [&](const InterleavedShape& s) { return impl_->read_interleaved(s, start_frame, frames); },
    }, impl_->shape);

    if (channels.empty()) {
        return block;
    }

    TraceBlock selected(frames, channels.size());
    for (size_t j = 0; j < channels.size(); ++j) {
        selected.col(static_cast<Eigen::Index>(j)) = block.col(static_cast<Eigen::Index>(channels[j]));
    }
    return selected;
}

const ChannelGeometry& RecordingHandle::channel_geometry() const {
    return impl_->geometry;
}

double RecordingHandle::duration_seconds() const {
    return impl_->info.duration_seconds();
}

const RecordingInfo& RecordingHandle::info() const {
    return impl_->info;
}

void RecordingHandle::close() noexcept {
    if (!impl_) return;
    impl_->raw.reset();
    impl_->group.reset();
    impl_->file.reset();
}

bool RecordingHandle::is_open() const noexcept {
    return impl_ && impl_->file.valid() && impl_->raw.valid();
}

// ============================================================================
// Well Discovery & Probing
// ============================================================================

WellDetection detect_wells(const std::filesystem::path& path) noexcept {
    auto fallback = [](std::string reason) {
        WellDetection detection;
        detection.wells.assign(DEFAULT_WELLS.begin(), DEFAULT_WELLS.end());
        detection.fell_back = true;
        detection.reason = std::move(reason);
        return detection;
    };

    try {
        h5::ErrorSilencer quiet;

        hid_t id = H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        if (id < 0) {
            return fallback("cannot open " + path.string());
        }
        h5::Handle file = h5::file(id);

        if (h5::object_type(file.get(), "wells") != H5I_GROUP) {
            return fallback("no /wells group in " + path.string());
        }
        h5::Handle wells = h5::group(H5Gopen2(file.get(), "wells", H5P_DEFAULT));
        if (!wells) {
            return fallback("cannot open /wells in " + path.string());
        }

        std::vector<int> found;
        for (const auto& name : list_members(wells.get())) {
            if (!name.starts_with("well")) continue;
            const char* first = name.data() + 4;
            const char* last = name.data() + name.size();
            int index = 0;
            auto [ptr, ec] = std::from_chars(first, last, index);
            if (ec == std::errc{} && ptr == last && first != last && index >= 0) {
                found.push_back(index);
            }
        }

        if (found.empty()) {
            return fallback("no well<NNN> entries under /wells in " + path.string());
        }

        std::sort(found.begin(), found.end());
        found.erase(std::unique(found.begin(), found.end()), found.end());
        return WellDetection{std::move(found), false, {}};
    } catch (const std::exception& e) {
        return fallback(e.what());
    }
}

std::expected<double, std::string> probe_duration_seconds(
    const std::filesystem::path& path, const std::string& stream) noexcept
{
    try {
        RecordingHandle recording(path, stream);
        return recording.duration_seconds();
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

}  // namespace mxwsort
