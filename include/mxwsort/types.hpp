#pragma once

#include <Eigen/Dense>

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace mxwsort {

// ============================================================================
// Timing Types
// ============================================================================
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = std::chrono::nanoseconds;

/// Converts duration to milliseconds (double precision)
inline double to_milliseconds(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

// ============================================================================
// Trace Data
// ============================================================================

/**
 * @brief Block of samples laid out [frames x channels]
 *
 * Row-major so that one frame (all channels at one instant) is contiguous,
 * which is also the on-disk order of the exported binary.
 */
using TraceBlock = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Half-open frame interval [start, end)
struct FrameRange {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool operator==(const FrameRange&) const = default;
};

// ============================================================================
// Recording Metadata
// ============================================================================

/**
 * @brief Dimensionality of the raw sample array on disk
 */
enum class ArrayLayout {
    Planar2D,       // [channels x samples]
    Interleaved1D   // [samples * channels], frame-major
};

/**
 * @brief Where the recording lives below the stream group
 */
enum class GroupLayout {
    NestedRecording,  // wells/wellNNN/recXXXX/...
    Direct            // wells/wellNNN/...
};

/**
 * @brief Storage type of raw samples as found in the file
 */
struct SampleFormat {
    bool is_float = false;
    bool is_signed = false;
    size_t bits = 16;

    /// Midpoint subtracted when reinterpreting unsigned samples as signed
    double unsigned_offset() const {
        return (is_float || is_signed) ? 0.0 : std::ldexp(1.0, static_cast<int>(bits) - 1);
    }
};

/// Physical position of one electrode (micrometres)
struct ChannelPosition {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const ChannelPosition&) const = default;
};

/// Positions index-aligned with read-out channel order
using ChannelGeometry = std::vector<ChannelPosition>;

/**
 * @brief Fixed properties of an opened recording stream
 *
 * Channel count and sampling rate never change for the lifetime of a handle.
 */
struct RecordingInfo {
    std::filesystem::path source;
    std::string stream;
    std::string group_path;               // Resolved HDF5 group, e.g. /wells/well000/rec0000
    double sampling_rate_hz = 0.0;
    size_t num_channels = 0;
    size_t num_frames = 0;
    ArrayLayout layout = ArrayLayout::Planar2D;
    GroupLayout group_layout = GroupLayout::NestedRecording;
    SampleFormat format;

    double duration_seconds() const {
        return sampling_rate_hz > 0.0 ? static_cast<double>(num_frames) / sampling_rate_hz : 0.0;
    }
};

// ============================================================================
// Well Naming
// ============================================================================

/// Canonical well set of a six-well MaxTwo plate, used when detection fails
inline constexpr std::array<int, 6> DEFAULT_WELLS = {0, 1, 2, 3, 4, 5};

/// Stream group name for a well index ("well000", "well001", ...)
inline std::string stream_name(int well_index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "well%03d", well_index);
    return buf;
}

const char* to_string(ArrayLayout layout);
const char* to_string(GroupLayout layout);

}  // namespace mxwsort
