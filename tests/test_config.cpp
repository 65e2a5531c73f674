#include <gtest/gtest.h>
#include <mxwsort.hpp>
#include <mxwsort/config.hpp>
#include <mxwsort/errors.hpp>
#include <mxwsort/logging.hpp>
#include <mxwsort/stage_timer.hpp>

#include "test_fixtures.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace mxwsort;

// ============================================================================
// Library
// ============================================================================

TEST(LibraryTest, VersionStringMatchesComponents) {
    const std::string expected = std::to_string(VERSION_MAJOR) + "." +
                                 std::to_string(VERSION_MINOR) + "." +
                                 std::to_string(VERSION_PATCH);
    EXPECT_EQ(std::string(VERSION), expected);
}

TEST(LibraryTest, BuildInfoNamesVersionAndHdf5) {
    const std::string info = build_info();
    EXPECT_NE(info.find(std::string("mxwsort v") + VERSION), std::string::npos) << info;
    EXPECT_NE(info.find("HDF5"), std::string::npos) << info;
    EXPECT_EQ(info, std::string(build_info()));
}

TEST(LibraryTest, InitializeIsRepeatable) {
    EXPECT_NO_THROW(initialize());
    EXPECT_NO_THROW(initialize());
    shutdown();
}

// ============================================================================
// Well Selection Parsing
// ============================================================================

TEST(WellSelectionTest, AutoAndEmptySelectDetection) {
    EXPECT_EQ(parse_well_selection("auto").mode, WellSelection::Mode::Auto);
    EXPECT_EQ(parse_well_selection("AUTO").mode, WellSelection::Mode::Auto);
    EXPECT_EQ(parse_well_selection("  Auto ").mode, WellSelection::Mode::Auto);
    EXPECT_EQ(parse_well_selection("").mode, WellSelection::Mode::Auto);
}

TEST(WellSelectionTest, InclusiveRange) {
    WellSelection sel = parse_well_selection("0-5");
    EXPECT_EQ(sel.mode, WellSelection::Mode::Explicit);
    EXPECT_EQ(sel.wells, (std::vector<int>{0, 1, 2, 3, 4, 5}));

    EXPECT_EQ(parse_well_selection("3-3").wells, (std::vector<int>{3}));
    EXPECT_EQ(parse_well_selection(" 2 - 4 ").wells, (std::vector<int>{2, 3, 4}));
}

TEST(WellSelectionTest, CommaListKeepsOrderAndSkipsBlanks) {
    EXPECT_EQ(parse_well_selection("0,2,4").wells, (std::vector<int>{0, 2, 4}));
    EXPECT_EQ(parse_well_selection("4, 1,,3,").wells, (std::vector<int>{4, 1, 3}));
    EXPECT_EQ(parse_well_selection("7").wells, (std::vector<int>{7}));
}

TEST(WellSelectionTest, MalformedInputThrows) {
    EXPECT_THROW(parse_well_selection("5-2"), ConfigValidationError);
    EXPECT_THROW(parse_well_selection("a,b"), ConfigValidationError);
    EXPECT_THROW(parse_well_selection("1-x"), ConfigValidationError);
    EXPECT_THROW(parse_well_selection(",,"), ConfigValidationError);
    EXPECT_THROW(parse_well_selection("-3"), ConfigValidationError);
}

TEST(WellSelectionTest, ErrorsAreAlsoMxwsortErrors) {
    EXPECT_THROW(parse_well_selection("nope"), Error);
    EXPECT_THROW(parse_well_selection("nope"), std::runtime_error);
}

TEST(WellSelectionTest, Formatting) {
    EXPECT_EQ(to_string(WellSelection::automatic()), "auto");
    EXPECT_EQ(to_string(WellSelection::single(3)), "only 3");
    EXPECT_EQ(to_string(WellSelection::explicit_list({0, 2, 4})), "0,2,4");
}

// ============================================================================
// Pipeline Config
// ============================================================================

TEST(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config;
    EXPECT_TRUE(config.is_valid());
    EXPECT_DOUBLE_EQ(config.start_s, 0.0);
    ASSERT_TRUE(config.dur_s.has_value());
    EXPECT_DOUBLE_EQ(*config.dur_s, 30.0);
    EXPECT_DOUBLE_EQ(config.bp_min_hz, 300.0);
    EXPECT_DOUBLE_EQ(config.bp_max_frac_nyq, 0.9);
    EXPECT_DOUBLE_EQ(config.ks4_highpass_cutoff_hz, 1.0);
    EXPECT_EQ(config.ks4_batch_size, 60000u);

    RunOptions options;
    EXPECT_TRUE(options.skip_existing);
    EXPECT_FALSE(options.dry_run);
}

TEST(PipelineConfigTest, FullDurationIsValid) {
    PipelineConfig config;
    config.dur_s.reset();
    EXPECT_TRUE(config.is_valid());
}

TEST(PipelineConfigTest, RejectsStructurallyInvalidValues) {
    PipelineConfig config;
    config.start_s = -1.0;
    EXPECT_FALSE(config.is_valid());

    config = PipelineConfig{};
    config.dur_s = 0.0;
    EXPECT_FALSE(config.is_valid());

    config = PipelineConfig{};
    config.bp_min_hz = 0.0;
    EXPECT_FALSE(config.is_valid());

    config = PipelineConfig{};
    config.bp_max_frac_nyq = -0.5;
    EXPECT_FALSE(config.is_valid());

    config = PipelineConfig{};
    config.ks4_batch_size = 0;
    EXPECT_FALSE(config.is_valid());
}

// ============================================================================
// Stage Timings
// ============================================================================

TEST(StageTimingsTest, RecordsInCompletionOrder) {
    StageTimings timings;
    timings.record("open", std::chrono::milliseconds(2));
    timings.record("export", std::chrono::microseconds(1500));

    ASSERT_EQ(timings.entries().size(), 2u);
    EXPECT_EQ(timings.entries()[0].first, "open");
    EXPECT_EQ(timings.entries()[1].first, "export");
    EXPECT_EQ(timings.total(), std::chrono::microseconds(3500));
    EXPECT_EQ(timings.format(), "open=2.0ms export=1.5ms");

    timings.reset();
    EXPECT_TRUE(timings.entries().empty());
    EXPECT_EQ(timings.format(), "");
}

TEST(StageTimingsTest, TimedStageRecordsOnScopeExit) {
    StageTimings timings;
    {
        MXWSORT_TIMED_STAGE(timings, "first");
        MXWSORT_TIMED_STAGE(timings, "second");
        EXPECT_TRUE(timings.entries().empty());
    }
    ASSERT_EQ(timings.entries().size(), 2u);
    // Destruction order is reverse of declaration
    EXPECT_EQ(timings.entries()[0].first, "second");
    EXPECT_EQ(timings.entries()[1].first, "first");
}

TEST(StageTimingsTest, TimedStageRecordsWhenScopeThrows) {
    StageTimings timings;
    try {
        MXWSORT_TIMED_STAGE(timings, "failing");
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    ASSERT_EQ(timings.entries().size(), 1u);
    EXPECT_EQ(timings.entries()[0].first, "failing");
    EXPECT_GE(timings.entries()[0].second.count(), 0);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggingTest, FileSinkReceivesDebugMessages) {
    test::TempDir dir;
    LogConfig config;
    config.console_level = spdlog::level::warn;
    config.log_file = dir / "run.log";
    init_logging(config);

    logger()->debug("debug line {}", 42);
    logger()->flush();

    std::ifstream f(dir / "run.log");
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("debug line 42"), std::string::npos) << text;

    init_logging();
    EXPECT_EQ(logger()->name(), LOGGER_NAME);
}

TEST(LoggingTest, UnwritableLogFileThrows) {
    test::TempDir dir;
    LogConfig config;
    config.log_file = dir / "missing" / "dir" / "run.log";
    std::ofstream(dir / "missing") << "a file, not a directory";
    EXPECT_THROW(init_logging(config), IoError);
    init_logging();
}
