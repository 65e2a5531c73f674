#pragma once

// mxwsort - Maxwell multi-well recording to spike-sort pipeline
// Version 0.1.0

#include "mxwsort/types.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/logging.hpp"
#include "mxwsort/config.hpp"
#include "mxwsort/raw_store.hpp"
#include "mxwsort/bandpass_filter.hpp"
#include "mxwsort/preprocessing.hpp"
#include "mxwsort/npy_io.hpp"
#include "mxwsort/json_io.hpp"
#include "mxwsort/exporter.hpp"
#include "mxwsort/spike_sorter.hpp"
#include "mxwsort/plot_renderer.hpp"
#include "mxwsort/qc_analyzer.hpp"
#include "mxwsort/stage_timer.hpp"
#include "mxwsort/orchestrator.hpp"

namespace mxwsort {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Library version components
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Initialize the library
 * Call once at startup. Configures logging and opens the HDF5 library.
 * Repeated calls only reconfigure logging.
 */
void initialize(const LogConfig& log_config = {});

/**
 * @brief Flush logs before program exit
 */
void shutdown();

/**
 * @brief Get build information string
 */
const char* build_info();

}  // namespace mxwsort
