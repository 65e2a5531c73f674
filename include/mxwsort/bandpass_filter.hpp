#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace mxwsort {

/**
 * @brief Second-Order Section (Biquad) IIR Filter
 *
 * Direct Form II Transposed. Double precision: the band stage runs each
 * sample through the cascade twice, and float state drifts on long windows.
 */
class BiquadFilter {
public:
    // y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
    double b0 = 1.0, b1 = 0.0, b2 = 0.0;
    double a1 = 0.0, a2 = 0.0;

    double z1 = 0.0, z2 = 0.0;

    [[nodiscard]] inline double process(double x) noexcept {
        double y = b0 * x + z1;
        z1 = b1 * x - a1 * y + z2;
        z2 = b2 * x - a2 * y;
        return y;
    }

    /**
     * @brief Load the state reached after a constant input x forever
     * @return The section's steady-state output for x
     */
    double settle(double x) noexcept {
        const double y = x * (b0 + b1 + b2) / (1.0 + a1 + a2);
        z2 = b2 * x - a2 * y;
        z1 = (b1 + b2) * x - (a1 + a2) * y;
        return y;
    }

    void reset() noexcept {
        z1 = z2 = 0.0;
    }
};

/**
 * @brief Butterworth band-pass as a cascade of high-pass and low-pass biquads
 *
 * 4th order by default (two sections per edge). process() is causal and
 * streaming; filter_zero_phase() runs the cascade forward then backward over
 * a whole buffer, squaring the magnitude response and cancelling phase.
 */
class ButterworthBandpass {
public:
    struct Config {
        double sample_rate = 20000.0;   // Hz (MaxOne/MaxTwo default)
        double low_cutoff = 300.0;      // Hz
        double high_cutoff = 9000.0;    // Hz
        uint8_t order = 4;              // 2 or 4
    };

    ButterworthBandpass();

    /// @throws std::invalid_argument unless 0 < low < high < fs/2
    explicit ButterworthBandpass(const Config& config)
        : config_(config) {
        design_filter();
    }

    [[nodiscard]] inline double process(double x) noexcept {
        double y = x;
        for (size_t i = 0; i < num_sections_; ++i) {
            y = sections_[i].process(y);
        }
        return y;
    }

    void process_buffer(std::span<double> buffer) noexcept {
        for (auto& x : buffer) {
            x = process(x);
        }
    }

    /**
     * @brief Forward-backward filtering of a complete buffer, in place
     *
     * The buffer is extended at both ends by odd reflection and each pass
     * starts from the steady state of its first sample, so edges carry
     * no start-up transient. Streaming state is left untouched.
     */
    void filter_zero_phase(std::span<double> signal) const {
        const size_t n = signal.size();
        if (n == 0) return;

        const size_t pad = std::min(padding_length(), n - 1);
        std::vector<double> ext(n + 2 * pad);

        for (size_t k = 1; k <= pad; ++k) {
            ext[pad - k] = 2.0 * signal[0] - signal[k];
            ext[pad + n - 1 + k] = 2.0 * signal[n - 1] - signal[n - 1 - k];
        }
        std::copy(signal.begin(), signal.end(), ext.begin() + static_cast<std::ptrdiff_t>(pad));

        run_pass(ext.begin(), ext.end());
        run_pass(ext.rbegin(), ext.rend());

        std::copy_n(ext.begin() + static_cast<std::ptrdiff_t>(pad), n, signal.begin());
    }

    /// Samples of odd reflection added on each side by filter_zero_phase()
    size_t padding_length() const noexcept {
        return 3 * (2 * num_sections_ + 1);
    }

    void reset() noexcept {
        for (auto& section : sections_) {
            section.reset();
        }
    }

    void reconfigure(const Config& config) {
        config_ = config;
        design_filter();
        reset();
    }

    const Config& config() const { return config_; }

private:
    Config config_;
    std::array<BiquadFilter, 4> sections_;
    size_t num_sections_ = 0;

    template <class It>
    void run_pass(It first, It last) const {
        if (first == last) return;

        auto sections = sections_;
        double level = *first;
        for (size_t i = 0; i < num_sections_; ++i) {
            level = sections[i].settle(level);
        }

        for (It it = first; it != last; ++it) {
            double y = *it;
            for (size_t i = 0; i < num_sections_; ++i) {
                y = sections[i].process(y);
            }
            *it = y;
        }
    }

    /**
     * @brief Bilinear transform with frequency pre-warping
     */
    void design_filter() {
        const double fs = config_.sample_rate;
        const double f1 = config_.low_cutoff;
        const double f2 = config_.high_cutoff;

        if (!(fs > 0.0) || !(f1 > 0.0) || !(f1 < f2) || !(f2 < fs / 2.0)) {
            throw std::invalid_argument(
                "Butterworth band-pass needs 0 < low < high < fs/2 (low=" +
                std::to_string(f1) + ", high=" + std::to_string(f2) +
                ", fs=" + std::to_string(fs) + ")");
        }

        const double w1 = std::tan(std::numbers::pi * f1 / fs);
        const double w2 = std::tan(std::numbers::pi * f2 / fs);

        if (config_.order == 2) {
            num_sections_ = 2;
            design_highpass(sections_[0], w1, std::numbers::sqrt2 / 2.0);
            design_lowpass(sections_[1], w2, std::numbers::sqrt2 / 2.0);
        } else {
            num_sections_ = 4;

            // Pole angles pi/8 and 3pi/8 of the 4th-order prototype
            const double q1 = 1.0 / (2.0 * std::cos(std::numbers::pi / 8.0));
            const double q2 = 1.0 / (2.0 * std::cos(3.0 * std::numbers::pi / 8.0));

            design_highpass(sections_[0], w1, q1);
            design_highpass(sections_[1], w1, q2);
            design_lowpass(sections_[2], w2, q1);
            design_lowpass(sections_[3], w2, q2);
        }
    }

    // H(s) = s^2 / (s^2 + s/Q + 1)
    static void design_highpass(BiquadFilter& bq, double wc, double Q) {
        const double wc2 = wc * wc;
        const double alpha = wc / Q;
        const double norm = 1.0 + alpha + wc2;

        bq.b0 = 1.0 / norm;
        bq.b1 = -2.0 / norm;
        bq.b2 = 1.0 / norm;
        bq.a1 = 2.0 * (wc2 - 1.0) / norm;
        bq.a2 = (1.0 - alpha + wc2) / norm;
    }

    // H(s) = 1 / (s^2 + s/Q + 1)
    static void design_lowpass(BiquadFilter& bq, double wc, double Q) {
        const double wc2 = wc * wc;
        const double alpha = wc / Q;
        const double norm = 1.0 + alpha + wc2;

        bq.b0 = wc2 / norm;
        bq.b1 = 2.0 * wc2 / norm;
        bq.b2 = wc2 / norm;
        bq.a1 = 2.0 * (wc2 - 1.0) / norm;
        bq.a2 = (1.0 - alpha + wc2) / norm;
    }
};

inline ButterworthBandpass::ButterworthBandpass()
    : ButterworthBandpass(Config{}) {}

}  // namespace mxwsort
