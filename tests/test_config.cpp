#include "Config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& text)
{
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream out(p);
    out << text;
    return p;
}

} // namespace

TEST(Config, DefaultsAreValid)
{
    Config cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_DOUBLE_EQ(cfg.tracker.match_threshold, 0.3);
    EXPECT_EQ(cfg.tracker.max_disappeared_frames, 10);
    EXPECT_DOUBLE_EQ(cfg.tracker.line_position, 0.6);
    EXPECT_EQ(cfg.speed.smoothing_window, 5);
    EXPECT_FALSE(cfg.calibration.meters_per_pixel.has_value());
}

TEST(Config, RejectsOutOfRangeValues)
{
    auto expect_invalid = [](auto mutate) {
        Config cfg;
        mutate(cfg);
        EXPECT_THROW(cfg.validate(), std::invalid_argument);
    };
    expect_invalid([](Config& c) { c.tracker.match_threshold = 1.5; });
    expect_invalid([](Config& c) { c.tracker.match_threshold = -0.1; });
    expect_invalid([](Config& c) { c.tracker.max_disappeared_frames = 0; });
    expect_invalid([](Config& c) { c.tracker.line_position = 0.0; });
    expect_invalid([](Config& c) { c.tracker.line_position = 1.0; });
    expect_invalid([](Config& c) { c.speed.smoothing_window = 0; });
    expect_invalid([](Config& c) { c.detector.min_vehicle_area = -1; });
    expect_invalid([](Config& c) { c.storage.save_interval_seconds = 0; });
    expect_invalid([](Config& c) { c.storage.bucket_width_kmh = 0; });
}

TEST(Config, LoadsIniSection)
{
    auto path = write_temp("speedtrack_config_test.ini",
        "; comment\n"
        "[other]\n"
        "match_threshold = 0.9\n"
        "[speedtrack]\n"
        "match_threshold = 0.45   # inline comment\n"
        "max_disappeared_frames=4\n"
        "overlap_policy = smaller\n"
        "line_axis = vertical\n"
        "meters_per_pixel = 0.02\n"
        "output_dir = out/run1\n"
        "session_files = true\n");

    Config cfg = Config::from_ini(path.string());
    EXPECT_DOUBLE_EQ(cfg.tracker.match_threshold, 0.45);
    EXPECT_EQ(cfg.tracker.max_disappeared_frames, 4);
    EXPECT_EQ(cfg.tracker.overlap_policy, OverlapPolicy::OverSmaller);
    EXPECT_EQ(cfg.tracker.line_axis, LineAxis::Vertical);
    ASSERT_TRUE(cfg.calibration.meters_per_pixel.has_value());
    EXPECT_DOUBLE_EQ(*cfg.calibration.meters_per_pixel, 0.02);
    EXPECT_EQ(cfg.storage.output_dir, "out/run1");
    EXPECT_TRUE(cfg.storage.session_files);
    fs::remove(path);
}

TEST(Config, MissingIniGivesDefaults)
{
    Config cfg = Config::from_ini("/nonexistent/speedtrack.ini");
    EXPECT_DOUBLE_EQ(cfg.tracker.match_threshold, 0.3);
}

TEST(Config, RejectsUnknownKeysAndBadValues)
{
    Config cfg;
    EXPECT_THROW(cfg.set("no_such_option", "1"), std::invalid_argument);
    EXPECT_THROW(cfg.set("match_threshold", "high"), std::invalid_argument);
    EXPECT_THROW(cfg.set("max_disappeared_frames", "3.5"), std::invalid_argument);
    EXPECT_THROW(cfg.set("overlap_policy", "giou"), std::invalid_argument);
    EXPECT_THROW(cfg.set("session_files", "maybe"), std::invalid_argument);
}

TEST(Config, PolicyNamesRoundTrip)
{
    EXPECT_EQ(parse_overlap_policy(to_string(OverlapPolicy::IoU)), OverlapPolicy::IoU);
    EXPECT_EQ(parse_line_axis(to_string(LineAxis::Vertical)), LineAxis::Vertical);
}
