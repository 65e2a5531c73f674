#include "mxwsort/spike_sorter.hpp"
#include "mxwsort/errors.hpp"
#include "mxwsort/json_io.hpp"
#include "mxwsort/logging.hpp"

#include <sys/wait.h>

#include <cstdlib>

#ifndef MXWSORT_KS4_BRIDGE
#define MXWSORT_KS4_BRIDGE "tools/run_kilosort4.py"
#endif

namespace mxwsort {

namespace {

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

}  // namespace

Json::Value SorterSettings::to_json() const {
    Json::Value j(Json::objectValue);
    j["filename"] = filename.string();
    j["probe_path"] = probe_path.string();
    j["results_dir"] = results_dir.string();
    j["fs"] = fs;
    j["n_chan_bin"] = static_cast<Json::UInt64>(n_chan_bin);
    j["batch_size"] = static_cast<Json::UInt64>(batch_size);
    j["highpass_cutoff"] = highpass_cutoff;
    return j;
}

// ============================================================================
// Kilosort4Runner
// ============================================================================

Kilosort4Runner::Kilosort4Runner()
    : Kilosort4Runner(Config{}) {}

Kilosort4Runner::Kilosort4Runner(Config config)
    : config_(std::move(config)) {
    if (config_.bridge_script.empty()) {
        config_.bridge_script = default_bridge_script();
    }
}

std::string Kilosort4Runner::command_line(const std::filesystem::path& settings_file) const {
    std::string cmd;
    for (const auto& [name, value] : config_.environment) {
        cmd += name + "=" + shell_quote(value) + " ";
    }
    cmd += shell_quote(config_.python) + " " +
           shell_quote(config_.bridge_script.string()) + " " +
           shell_quote(settings_file.string());
    return cmd;
}

void Kilosort4Runner::run(const SorterSettings& settings) {
    std::error_code ec;
    std::filesystem::create_directories(settings.results_dir, ec);
    if (ec) {
        throw IoError("Cannot create " + settings.results_dir.string() + ": " + ec.message());
    }

    const auto settings_file = settings.results_dir / SETTINGS_FILE;
    write_json(settings_file, settings.to_json());

    const std::string cmd = command_line(settings_file);
    logger()->info("Running Kilosort4: {}", cmd);

    const int status = std::system(cmd.c_str());
    if (status == -1) {
        throw IoError("Cannot launch Kilosort4 bridge: " + cmd);
    }
    if (WIFSIGNALED(status)) {
        throw SpikeSortError("Kilosort4 on " + settings.filename.string() +
                             " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw SpikeSortError("Kilosort4 on " + settings.filename.string() +
                             " exited with status " + std::to_string(WEXITSTATUS(status)));
    }

    if (!spike_sort_complete(settings.results_dir)) {
        logger()->warn("Kilosort4 finished but {} or {} is missing in {}",
                       SPIKE_TIMES_FILE, SPIKE_CLUSTERS_FILE, settings.results_dir.string());
    }
}

std::filesystem::path default_bridge_script() {
    if (const char* env = std::getenv("MXWSORT_KS4_BRIDGE"); env != nullptr && *env != '\0') {
        return env;
    }
    return MXWSORT_KS4_BRIDGE;
}

bool spike_sort_complete(const std::filesystem::path& results_dir) {
    std::error_code ec;
    return std::filesystem::is_regular_file(results_dir / SPIKE_TIMES_FILE, ec)
        && std::filesystem::is_regular_file(results_dir / SPIKE_CLUSTERS_FILE, ec);
}

}  // namespace mxwsort
