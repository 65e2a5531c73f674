#include "mxwsort/preprocessing.hpp"
#include "mxwsort/bandpass_filter.hpp"
#include "mxwsort/config.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/logging.hpp"
#include "mxwsort/raw_store.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mxwsort {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

// Ties go to the even frame, as in round()
size_t seconds_to_frame(double seconds, double fs) {
    return static_cast<size_t>(std::nearbyint(seconds * fs));
}

}  // namespace

std::string describe(const TransformStage& stage) {
    std::ostringstream ss;
    std::visit(overloaded{
        [&](const SignConversion&) { ss << "sign-conversion"; },
        [&](const TimeWindow& w) {
            ss << "time-window(start=" << w.start_s << "s, dur=";
            if (w.duration_s) ss << *w.duration_s << "s)";
            else ss << "full)";
        },
        [&](const BandRestriction& b) {
            ss << "band-pass(min=" << b.min_hz << "Hz, max=" << b.fraction_of_nyquist << "*nyq)";
        },
    }, stage);
    return ss.str();
}

BandLimits derive_band_limits(double fs, double min_hz, double fraction_of_nyquist) {
    BandLimits limits;
    limits.nyquist_hz = 0.5 * fs;
    limits.min_hz = min_hz;
    limits.max_hz = fraction_of_nyquist * limits.nyquist_hz;
    if (limits.max_hz >= limits.nyquist_hz) {
        limits.max_hz = 0.99 * limits.nyquist_hz;
    }

    if (!(0.0 < limits.min_hz && limits.min_hz < limits.max_hz && limits.max_hz < limits.nyquist_hz)) {
        std::ostringstream ss;
        ss << "Bad bandpass: fmin=" << limits.min_hz
           << ", fmax=" << limits.max_hz
           << ", nyq=" << limits.nyquist_hz;
        throw ConfigValidationError(ss.str());
    }
    return limits;
}

std::optional<FrameRange> resolve_time_window(double fs, double start_s,
                                              std::optional<double> duration_s,
                                              size_t total_frames) {
    if (!duration_s) {
        return std::nullopt;
    }
    if (!(start_s >= 0.0)) {
        throw ConfigValidationError("Bad time window: start_s=" + std::to_string(start_s) +
                                    " must be non-negative");
    }
    if (!(*duration_s > 0.0)) {
        throw ConfigValidationError("Bad time window: dur_s=" + std::to_string(*duration_s) +
                                    " must be positive");
    }

    FrameRange range;
    range.start = seconds_to_frame(start_s, fs);
    range.end = std::min(seconds_to_frame(start_s + *duration_s, fs), total_frames);

    if (range.start >= total_frames) {
        throw ConfigValidationError(
            "Bad time window: start_s=" + std::to_string(start_s) + " (frame " +
            std::to_string(range.start) + ") is past the end of a recording of " +
            std::to_string(total_frames) + " frames");
    }
    return range;
}

// ============================================================================
// PreprocessingChain Implementation
// ============================================================================

namespace {

struct ResolvedSign {
    double offset = 0.0;
};

struct ResolvedWindow {
    FrameRange range;  // In upstream frames
};

struct ResolvedBand {
    BandLimits limits;
    ButterworthBandpass filter;
    size_t margin = 0;
};

using ResolvedStage = std::variant<ResolvedSign, ResolvedWindow, ResolvedBand>;

}  // namespace

struct PreprocessingChain::Impl {
    std::shared_ptr<const RecordingHandle> source;
    std::vector<TransformStage> stages;
    std::vector<ResolvedStage> resolved;
    std::vector<size_t> frames_after;  // View length after each stage
    FrameRange source_range;

    size_t frames_at(size_t level) const {
        return level == 0 ? source->num_frames() : frames_after[level - 1];
    }

    TraceBlock read_level(size_t level, size_t start, size_t end,
                          std::span<const size_t> channels) const {
        if (level == 0) {
            return source->read_window(start, end, channels);
        }

        return std::visit(overloaded{
            [&](const ResolvedSign& s) {
                TraceBlock block = read_level(level - 1, start, end, channels);
                if (s.offset != 0.0) {
                    block.array() -= static_cast<float>(s.offset);
                }
                return block;
            },
            [&](const ResolvedWindow& w) {
                return read_level(level - 1, w.range.start + start, w.range.start + end, channels);
            },
            [&](const ResolvedBand& b) {
                const size_t upstream = frames_at(level - 1);
                const size_t lo = start > b.margin ? start - b.margin : 0;
                const size_t hi = std::min(end + b.margin, upstream);

                TraceBlock padded = read_level(level - 1, lo, hi, channels);
                const Eigen::Index rows = padded.rows();
                const Eigen::Index keep = static_cast<Eigen::Index>(end - start);
                const Eigen::Index offset = static_cast<Eigen::Index>(start - lo);

                TraceBlock out(keep, padded.cols());
                std::vector<double> trace(static_cast<size_t>(rows));
                for (Eigen::Index c = 0; c < padded.cols(); ++c) {
                    for (Eigen::Index r = 0; r < rows; ++r) {
                        trace[static_cast<size_t>(r)] = padded(r, c);
                    }
                    b.filter.filter_zero_phase(trace);
                    for (Eigen::Index r = 0; r < keep; ++r) {
                        out(r, c) = static_cast<float>(trace[static_cast<size_t>(offset + r)]);
                    }
                }
                return out;
            },
        }, resolved[level - 1]);
    }
};

size_t PreprocessingChain::band_margin_frames(double fs, double min_hz) {
    const double frames = std::max(BAND_MARGIN_MIN_S * fs, BAND_MARGIN_PERIODS * fs / min_hz);
    return static_cast<size_t>(std::ceil(frames));
}

PreprocessingChain::PreprocessingChain(std::shared_ptr<const RecordingHandle> source)
    : impl_(std::make_unique<Impl>())
{
    if (!source) {
        throw std::invalid_argument("PreprocessingChain needs a recording");
    }
    impl_->source = std::move(source);
    impl_->source_range = {0, impl_->source->num_frames()};
}

PreprocessingChain::~PreprocessingChain() = default;
PreprocessingChain::PreprocessingChain(PreprocessingChain&&) noexcept = default;
PreprocessingChain& PreprocessingChain::operator=(PreprocessingChain&&) noexcept = default;

PreprocessingChain PreprocessingChain::standard(std::shared_ptr<const RecordingHandle> source,
                                                const PipelineConfig& config) {
    PreprocessingChain chain(std::move(source));
    chain.add(SignConversion{})
         .add(TimeWindow{config.start_s, config.dur_s})
         .add(BandRestriction{config.bp_min_hz, config.bp_max_frac_nyq});
    return chain;
}

PreprocessingChain& PreprocessingChain::add(const TransformStage& stage) {
    const double fs = sampling_rate();
    const size_t upstream = num_frames();

    ResolvedStage resolved = std::visit(overloaded{
        [&](const SignConversion&) -> ResolvedStage {
            return ResolvedSign{impl_->source->info().format.unsigned_offset()};
        },
        [&](const TimeWindow& w) -> ResolvedStage {
            auto range = resolve_time_window(fs, w.start_s, w.duration_s, upstream);
            return ResolvedWindow{range.value_or(FrameRange{0, upstream})};
        },
        [&](const BandRestriction& b) -> ResolvedStage {
            BandLimits limits = derive_band_limits(fs, b.min_hz, b.fraction_of_nyquist);
            ButterworthBandpass::Config cfg;
            cfg.sample_rate = fs;
            cfg.low_cutoff = limits.min_hz;
            cfg.high_cutoff = limits.max_hz;
            return ResolvedBand{limits, ButterworthBandpass(cfg),
                                band_margin_frames(fs, limits.min_hz)};
        },
    }, stage);

    size_t frames = upstream;
    if (const auto* w = std::get_if<ResolvedWindow>(&resolved)) {
        frames = w->range.size();
        const size_t base = impl_->source_range.start;
        impl_->source_range = {base + w->range.start, base + w->range.end};
    }

    impl_->stages.push_back(stage);
    impl_->resolved.push_back(std::move(resolved));
    impl_->frames_after.push_back(frames);

    logger()->debug("Preprocessing stage {}: {} -> {} frames",
                    impl_->stages.size(), describe(stage), frames);
    return *this;
}

TraceBlock PreprocessingChain::read(size_t start_frame, size_t end_frame,
                                    std::span<const size_t> channels) const {
    if (start_frame > end_frame || end_frame > num_frames()) {
        throw std::out_of_range(
            "Frame window [" + std::to_string(start_frame) + ", " + std::to_string(end_frame) +
            ") outside preprocessed view of " + std::to_string(num_frames()) + " frames");
    }
    return impl_->read_level(impl_->resolved.size(), start_frame, end_frame, channels);
}

size_t PreprocessingChain::num_frames() const {
    return impl_->frames_at(impl_->resolved.size());
}

size_t PreprocessingChain::num_channels() const {
    return impl_->source->num_channels();
}

double PreprocessingChain::sampling_rate() const {
    return impl_->source->sampling_rate();
}

const ChannelGeometry& PreprocessingChain::channel_geometry() const {
    return impl_->source->channel_geometry();
}

FrameRange PreprocessingChain::source_range() const {
    return impl_->source_range;
}

std::optional<BandLimits> PreprocessingChain::band_limits() const {
    for (auto it = impl_->resolved.rbegin(); it != impl_->resolved.rend(); ++it) {
        if (const auto* b = std::get_if<ResolvedBand>(&*it)) {
            return b->limits;
        }
    }
    return std::nullopt;
}

const std::vector<TransformStage>& PreprocessingChain::stages() const {
    return impl_->stages;
}

}  // namespace mxwsort
