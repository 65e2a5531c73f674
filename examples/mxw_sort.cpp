/**
 * mxw_sort
 *
 * Preprocess Maxwell .raw.h5 recordings, export them for Kilosort4, run the
 * sorter and write QC summaries. Accepts one file, a directory tree
 * (mirrored into the output root), or a flat folder with --flat.
 */

#include <mxwsort.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace mxwsort;

namespace {

struct CliArgs {
    std::filesystem::path source;
    std::filesystem::path out;
    PipelineConfig config;
    RunOptions options;
    WellSelection selection;
    bool flat = false;
    bool debug = false;
    std::optional<std::filesystem::path> log_file;
    Kilosort4Runner::Config sorter;
};

void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " <h5-file-or-dir> --out <dir> [options]\n"
        << "\n"
        << "  --out DIR                 Output root folder (required)\n"
        << "  --start-s S               Start time in seconds (default 0)\n"
        << "  --dur-s S                 Seconds to process; 0 means the full file (default 30)\n"
        << "  --wells LIST              '0-5', '0,2,4' or 'auto' (default auto)\n"
        << "  --only-well N             Run exactly one well index\n"
        << "  --bp-min HZ               Band-pass lower edge (default 300)\n"
        << "  --bp-max-frac-nyq F       Band-pass upper edge as fraction of Nyquist (default 0.9)\n"
        << "  --ks4-highpass-cutoff HZ  Kilosort4 highpass cutoff, 1.0 = disabled (default 1.0)\n"
        << "  --ks4-batch-size N        Kilosort4 batch size (default 60000)\n"
        << "  --ks4-python PATH         Interpreter with kilosort installed (default python3)\n"
        << "  --ks4-bridge PATH         Bridge script (default $MXWSORT_KS4_BRIDGE\n"
        << "                            or the built-in tools path)\n"
        << "  --skip-existing           Skip wells with Kilosort4 outputs (default)\n"
        << "  --no-skip-existing        Re-run every well\n"
        << "  --dry-run                 Print actions without doing any work\n"
        << "  --flat                    Directory input: only files directly inside, output per stem\n"
        << "  --log-file PATH           Also log at debug level to PATH\n"
        << "  --debug                   Debug-level console output\n"
        << "  --version                 Show version and build information\n"
        << "  --help                    Show this help\n";
}

template <class T>
T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw ConfigValidationError(std::string(flag) + " expects a number, got '" +
                                    std::string(text) + "'");
    }
    return value;
}

/// Returns false if the program should exit without running
bool parse_args(int argc, char** argv, CliArgs& args) {
    std::optional<int> only_well;
    std::string wells = "auto";
    bool have_out = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw ConfigValidationError(std::string(arg) + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--version") {
            std::cout << build_info();
            return false;
        } else if (arg == "--out") {
            args.out = std::string(value());
            have_out = true;
        } else if (arg == "--start-s") {
            args.config.start_s = parse_number<double>(arg, value());
        } else if (arg == "--dur-s") {
            const double dur = parse_number<double>(arg, value());
            args.config.dur_s = dur == 0.0 ? std::nullopt : std::optional<double>(dur);
        } else if (arg == "--wells") {
            wells = std::string(value());
        } else if (arg == "--only-well") {
            only_well = parse_number<int>(arg, value());
        } else if (arg == "--bp-min") {
            args.config.bp_min_hz = parse_number<double>(arg, value());
        } else if (arg == "--bp-max-frac-nyq") {
            args.config.bp_max_frac_nyq = parse_number<double>(arg, value());
        } else if (arg == "--ks4-highpass-cutoff") {
            args.config.ks4_highpass_cutoff_hz = parse_number<double>(arg, value());
        } else if (arg == "--ks4-batch-size") {
            args.config.ks4_batch_size = parse_number<size_t>(arg, value());
        } else if (arg == "--ks4-python") {
            args.sorter.python = std::string(value());
        } else if (arg == "--ks4-bridge") {
            args.sorter.bridge_script = std::string(value());
        } else if (arg == "--skip-existing") {
            args.options.skip_existing = true;
        } else if (arg == "--no-skip-existing") {
            args.options.skip_existing = false;
        } else if (arg == "--dry-run") {
            args.options.dry_run = true;
        } else if (arg == "--flat") {
            args.flat = true;
        } else if (arg == "--log-file") {
            args.log_file = std::string(value());
        } else if (arg == "--debug") {
            args.debug = true;
        } else if (arg.starts_with("--")) {
            throw ConfigValidationError("Unknown option " + std::string(arg));
        } else if (args.source.empty()) {
            args.source = std::string(arg);
        } else {
            throw ConfigValidationError("Unexpected argument " + std::string(arg));
        }
    }

    if (args.source.empty() || !have_out) {
        print_usage(argv[0]);
        return false;
    }

    args.selection = only_well ? WellSelection::single(*only_well)
                               : parse_well_selection(wells);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs args;
    try {
        if (!parse_args(argc, argv, args)) {
            return argc == 1 ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        LogConfig log_config;
        log_config.console_level = args.debug ? spdlog::level::debug : spdlog::level::info;
        log_config.log_file = args.log_file;
        initialize(log_config);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    auto log = logger();
    try {
        if (!args.options.dry_run) {
            std::filesystem::create_directories(args.out);
        }

        auto sorter = std::make_shared<Kilosort4Runner>(args.sorter);
        Orchestrator orchestrator(args.config, args.options, sorter);

        log->debug("Wells: {}, dry-run: {}, skip-existing: {}",
                   to_string(args.selection), args.options.dry_run, args.options.skip_existing);

        BatchReport report;
        if (std::filesystem::is_directory(args.source)) {
            report = args.flat
                ? orchestrator.run_flat(args.source, args.out, args.selection)
                : orchestrator.run_recursive(args.source, args.out, args.selection);
        } else {
            report = orchestrator.run_file(args.source, args.out, args.selection);
        }

        log->info("Finished: {} done, {} skipped, {} previewed",
                  report.count(WellState::Done), report.count(WellState::Skip),
                  report.count(WellState::DryRunPreview));
    } catch (const std::exception& e) {
        log->error("Aborted: {}", e.what());
        shutdown();
        return EXIT_FAILURE;
    }

    shutdown();
    return EXIT_SUCCESS;
}
