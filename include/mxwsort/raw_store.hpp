#pragma once

#include "types.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mxwsort {

/**
 * @brief Lazy, windowed reader for one stream of a Maxwell .raw.h5 file
 *
 * Tolerates both on-disk layouts:
 *
 *   wells/well000/rec0000/{settings,groups}   (nested recording, tried first)
 *   wells/well000/{settings,groups}           (direct)
 *
 * and both raw array shapes ([channels x samples] or flat interleaved).
 * The layout is resolved once at open time into a tagged variant; reads
 * touch only the requested frame range.
 *
 * The HDF5 file stays open for the lifetime of the handle and is released
 * by close() or the destructor, whichever comes first.
 */
class RecordingHandle {
public:
    /**
     * @brief Open a stream and resolve its layout and geometry
     * @throws LayoutResolutionError if no recognised structure exists
     * @throws IoError if the file cannot be opened or read
     */
    RecordingHandle(const std::filesystem::path& path, const std::string& stream);
    ~RecordingHandle();

    // Non-copyable, movable
    RecordingHandle(const RecordingHandle&) = delete;
    RecordingHandle& operator=(const RecordingHandle&) = delete;
    RecordingHandle(RecordingHandle&&) noexcept;
    RecordingHandle& operator=(RecordingHandle&&) noexcept;

    /**
     * @brief Read frames [start_frame, end_frame) as [frames x channels]
     * @param channels Read-out channel indices to keep; empty keeps all
     * @throws std::out_of_range on an invalid frame range or channel index
     * @throws IoError if the handle is closed or the read fails
     */
    TraceBlock read_window(size_t start_frame, size_t end_frame,
                           std::span<const size_t> channels = {}) const;

    /// Electrode positions, index-aligned with read-out channel order
    const ChannelGeometry& channel_geometry() const;

    /// Metadata only, never reads samples
    double duration_seconds() const;

    const RecordingInfo& info() const;
    double sampling_rate() const { return info().sampling_rate_hz; }
    size_t num_channels() const { return info().num_channels; }
    size_t num_frames() const { return info().num_frames; }

    /// Release the file handle; idempotent
    void close() noexcept;
    bool is_open() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Result of well auto-detection
 *
 * Detection is advisory: when the file structure is unusable the canonical
 * DEFAULT_WELLS are returned with fell_back set and the reason recorded.
 */
struct WellDetection {
    std::vector<int> wells;
    bool fell_back = false;
    std::string reason;
};

/**
 * @brief Enumerate wells named "well<NNN>" below /wells
 *
 * Returns sorted unique indices. Never throws.
 */
WellDetection detect_wells(const std::filesystem::path& path) noexcept;

/**
 * @brief Duration of a stream in seconds from metadata alone
 *
 * Used for dry-run previews; failures come back as an error string instead
 * of an exception.
 */
std::expected<double, std::string> probe_duration_seconds(
    const std::filesystem::path& path, const std::string& stream) noexcept;

}  // namespace mxwsort
