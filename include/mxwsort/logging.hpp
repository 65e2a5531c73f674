#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace mxwsort {

/// Name of the library logger in the spdlog registry
inline constexpr const char* LOGGER_NAME = "mxwsort";

struct LogConfig {
    spdlog::level::level_enum console_level = spdlog::level::info;
    std::optional<std::filesystem::path> log_file;  // Debug-level file sink when set
};

/**
 * @brief Configure the library logger
 *
 * Replaces any previously registered "mxwsort" logger. Throws IoError when
 * the log file cannot be created.
 */
void init_logging(const LogConfig& config = {});

/**
 * @brief Library logger
 *
 * Creates a stdout logger at info level on first use if init_logging()
 * was never called.
 */
std::shared_ptr<spdlog::logger> logger();

}  // namespace mxwsort
