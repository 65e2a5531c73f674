#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mxwsort {

/**
 * @brief Parameters that affect processing results
 *
 * Everything here is written to the run-metadata sidecar so that a run
 * can be reproduced from its outputs.
 */
struct PipelineConfig {
    // Time selection
    double start_s = 0.0;
    std::optional<double> dur_s = 30.0;   // Empty = full recording

    // Preprocessing
    double bp_min_hz = 300.0;
    double bp_max_frac_nyq = 0.9;         // Upper edge as fraction of fs/2

    // Spike-sort engine
    double ks4_highpass_cutoff_hz = 1.0;  // 1.0 effectively disables (already band-passed)
    size_t ks4_batch_size = 60000;

    /// Structural checks only; band ordering needs fs and is checked at run time
    bool is_valid() const {
        return start_s >= 0.0
            && (!dur_s || *dur_s > 0.0)
            && bp_min_hz > 0.0
            && bp_max_frac_nyq > 0.0
            && ks4_batch_size > 0;
    }
};

/// Execution policy, does not affect results
struct RunOptions {
    bool skip_existing = true;
    bool dry_run = false;
};

/**
 * @brief Which wells of a file to process
 */
struct WellSelection {
    enum class Mode {
        Auto,       // Detect from the file
        Explicit,   // Caller-supplied list, processed in the given order
        Single      // Exactly one well, overrides everything else
    };

    Mode mode = Mode::Auto;
    std::vector<int> wells;

    static WellSelection automatic() { return {}; }
    static WellSelection explicit_list(std::vector<int> wells) {
        return {Mode::Explicit, std::move(wells)};
    }
    static WellSelection single(int well) { return {Mode::Single, {well}}; }
};

/**
 * @brief Parse a well selection string
 *
 * Accepts "auto" (any case) or empty, an inclusive range "0-5", or a comma
 * list "0,2,4" in which blank items are ignored.
 *
 * @throws ConfigValidationError on malformed input
 */
WellSelection parse_well_selection(std::string_view text);

std::string to_string(const WellSelection& selection);

}  // namespace mxwsort
