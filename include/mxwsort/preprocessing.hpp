#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace mxwsort {

class RecordingHandle;
struct PipelineConfig;

// ============================================================================
// Transform Stages
// ============================================================================

/// Reinterpret unsigned samples as signed by subtracting the range midpoint
struct SignConversion {};

/// Restrict to [round(start_s*fs), round((start_s+duration_s)*fs)); no duration = pass-through
struct TimeWindow {
    double start_s = 0.0;
    std::optional<double> duration_s;
};

/// Band-pass between min_hz and fraction_of_nyquist * fs/2
struct BandRestriction {
    double min_hz = 300.0;
    double fraction_of_nyquist = 0.9;
};

/// Stage descriptor; parameters are resolved against the upstream view when added
using TransformStage = std::variant<SignConversion, TimeWindow, BandRestriction>;

std::string describe(const TransformStage& stage);

// ============================================================================
// Parameter Derivation
// ============================================================================

struct BandLimits {
    double min_hz = 0.0;
    double max_hz = 0.0;
    double nyquist_hz = 0.0;
};

/**
 * @brief Derive band edges from the sampling rate
 *
 * max_hz = fraction_of_nyquist * fs/2, clamped to 0.99 * fs/2 when it
 * reaches Nyquist.
 *
 * @throws ConfigValidationError unless 0 < min_hz < max_hz < nyquist
 */
BandLimits derive_band_limits(double fs, double min_hz, double fraction_of_nyquist);

/**
 * @brief Frame range of a time window, clipped to the recording
 *
 * @return std::nullopt when no duration is given (full recording)
 * @throws ConfigValidationError on a negative start, non-positive duration,
 *         or a start at or past the last frame
 */
std::optional<FrameRange> resolve_time_window(double fs, double start_s,
                                              std::optional<double> duration_s,
                                              size_t total_frames);

// ============================================================================
// Preprocessing Chain
// ============================================================================

/**
 * @brief Ordered list of lazy transforms over a recording
 *
 * Nothing is read when stages are added. read() evaluates the list from the
 * last stage back to the source, narrowing the frame request through windows
 * and widening it by twelve periods of the lower band edge so that consecutive
 * chunked reads join without edge artefacts.
 *
 * Channel count and sampling rate are those of the source; only the frame
 * range narrows.
 */
class PreprocessingChain {
public:
    /// Periods of the lower band edge read on each side of a band-pass window.
    /// The high-pass transient decays below float resolution within this span.
    static constexpr double BAND_MARGIN_PERIODS = 12.0;
    static constexpr double BAND_MARGIN_MIN_S = 0.005;

    /// Frames read on each side of a band-pass window with lower edge min_hz
    static size_t band_margin_frames(double fs, double min_hz);

    explicit PreprocessingChain(std::shared_ptr<const RecordingHandle> source);
    ~PreprocessingChain();

    PreprocessingChain(PreprocessingChain&&) noexcept;
    PreprocessingChain& operator=(PreprocessingChain&&) noexcept;

    /**
     * @brief Sign conversion, time window, band-pass, in that order
     * @throws ConfigValidationError on invalid window or band parameters
     */
    static PreprocessingChain standard(std::shared_ptr<const RecordingHandle> source,
                                       const PipelineConfig& config);

    /**
     * @brief Append a stage on top of the current view
     * @throws ConfigValidationError if its parameters are invalid for the view
     */
    PreprocessingChain& add(const TransformStage& stage);

    /**
     * @brief Materialize frames [start_frame, end_frame) of the final view
     * @throws std::out_of_range on an invalid frame range or channel index
     */
    TraceBlock read(size_t start_frame, size_t end_frame,
                    std::span<const size_t> channels = {}) const;

    size_t num_frames() const;
    size_t num_channels() const;
    double sampling_rate() const;
    const ChannelGeometry& channel_geometry() const;

    /// Frames of the source recording covered by the final view
    FrameRange source_range() const;

    /// Resolved band edges of the last band stage, if any
    std::optional<BandLimits> band_limits() const;

    const std::vector<TransformStage>& stages() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace mxwsort
