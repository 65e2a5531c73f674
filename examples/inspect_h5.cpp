/**
 * inspect_h5
 *
 * Print the wells of a Maxwell .raw.h5 file with their layout, sampling
 * rate, channel count and duration. Reads metadata only.
 */

#include <mxwsort.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string_view>

using namespace mxwsort;

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <file.raw.h5> | --version\n";
        return EXIT_FAILURE;
    }
    if (std::string_view(argv[1]) == "--version") {
        std::cout << build_info();
        return EXIT_SUCCESS;
    }
    const std::filesystem::path path = argv[1];

    initialize();

    WellDetection detection = detect_wells(path);
    std::cout << path.string() << "\n";
    if (detection.fell_back) {
        std::cout << "  wells: default set (" << detection.reason << ")\n";
    } else {
        std::cout << "  wells: " << detection.wells.size() << " detected\n";
    }

    int failures = 0;
    for (int well : detection.wells) {
        const std::string stream = stream_name(well);
        try {
            RecordingHandle recording(path, stream);
            const RecordingInfo& info = recording.info();
            std::cout << "  " << stream
                      << "  group=" << info.group_path
                      << "  layout=" << to_string(info.group_layout)
                      << "/" << to_string(info.layout)
                      << "  fs=" << info.sampling_rate_hz << " Hz"
                      << "  channels=" << info.num_channels
                      << "  duration=" << std::fixed << std::setprecision(2)
                      << info.duration_seconds() << " s"
                      << std::defaultfloat << "\n";
        } catch (const Error& e) {
            std::cout << "  " << stream << "  unreadable: " << e.what() << "\n";
            ++failures;
        }
    }

    shutdown();
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
