#include "mxwsort.hpp"

#include <hdf5.h>

#include <atomic>
#include <string>

namespace mxwsort {

static std::atomic<bool> g_initialized{false};

void initialize(const LogConfig& log_config) {
    init_logging(log_config);
    if (g_initialized.exchange(true)) {
        return;
    }
    if (H5open() < 0) {
        throw IoError("Failed to initialize the HDF5 library");
    }
}

void shutdown() {
    logger()->flush();
    g_initialized.store(false);
}

const char* build_info() {
    static const std::string info =
        "mxwsort v" + std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) +
        "." + std::to_string(VERSION_PATCH) + "\n"
        "Compiled: " __DATE__ " " __TIME__ "\n"
        H5_VERS_INFO "\n"
        "Compiler: "
#ifdef _MSC_VER
        "MSVC\n";
#elif defined(__clang__)
        "Clang\n";
#elif defined(__GNUC__)
        "GCC\n";
#else
        "Unknown\n";
#endif
    return info.c_str();
}

}  // namespace mxwsort
