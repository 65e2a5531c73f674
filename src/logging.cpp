#include "mxwsort/logging.hpp"
#include "mxwsort/errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace mxwsort {

namespace {

constexpr const char* PATTERN = "[%H:%M:%S] [%L] %v";

std::mutex g_logger_mutex;

}  // namespace

void init_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(config.console_level);
    sinks.push_back(console);

    if (config.log_file) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_file->string(), true);
            file->set_level(spdlog::level::debug);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            throw IoError("Log init failed for " + config.log_file->string() + ": " + e.what());
        }
    }

    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_level(spdlog::level::trace);
    log->set_pattern(PATTERN);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(log);
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto log = spdlog::stdout_color_mt(LOGGER_NAME);
    log->set_level(spdlog::level::info);
    log->set_pattern(PATTERN);
    return log;
}

}  // namespace mxwsort
