#include "Errors.hpp"
#include "SpeedAggregator.hpp"
#include <gtest/gtest.h>

namespace {

const cv::Size kFrame(1920, 1080);

Config make_config(int window = 5)
{
    Config cfg;
    cfg.speed.smoothing_window = window;
    cfg.tracker.max_disappeared_frames = 1;
    return cfg;
}

Detection box(double x, double y)
{
    return {cv::Rect2d(x, y, 100, 100), 0, 0.0};
}

} // namespace

TEST(InstantaneousSpeed, FiftyPixelsOverFiveFrames)
{
    Calibrator c(0.01);
    TrackPoint prev{{0, 0}, 0, 0.0};
    TrackPoint last{{30, 40}, 5, 0.1667};

    double mps = SpeedAggregator::instantaneous_speed(prev, last, c);
    EXPECT_NEAR(mps, 0.5 / 0.1667, 1e-12);
    EXPECT_NEAR(mps, 3.0, 0.01);
    EXPECT_NEAR(mps * kMpsToKmh, 10.8, 0.01);
}

TEST(InstantaneousSpeed, RejectsTimeThatDoesNotAdvance)
{
    Calibrator c(0.01);
    TrackPoint prev{{0, 0}, 0, 1.0};
    EXPECT_THROW(SpeedAggregator::instantaneous_speed(prev, {{5, 0}, 1, 1.0}, c),
                 NonMonotonicTimestampError);
    EXPECT_THROW(SpeedAggregator::instantaneous_speed(prev, {{5, 0}, 1, 0.9}, c),
                 NonMonotonicTimestampError);
}

TEST(SpeedAggregator, UnknownUntilTwoPoints)
{
    Config cfg = make_config();
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(1.0));

    EXPECT_EQ(s.update(t.update({box(0, 0)}, 0, 0.0)), 0);
    EXPECT_FALSE(s.speed(0).has_value());
    EXPECT_FALSE(s.average_kmh().has_value());
    EXPECT_FALSE(s.speed(42).has_value());

    EXPECT_EQ(s.update(t.update({box(10, 0)}, 1, 1.0)), 1);
    auto sp = s.speed(0);
    ASSERT_TRUE(sp.has_value());
    EXPECT_DOUBLE_EQ(sp->mps, 10.0);
    EXPECT_DOUBLE_EQ(sp->kmh, 36.0);
    EXPECT_EQ(sp->samples, 1u);
}

TEST(SpeedAggregator, AveragesOnlyTheLastKSamples)
{
    Config cfg = make_config(3);
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(1.0));

    // displacements of 5, 10, 15 and 20 px per second
    double x = 0;
    s.update(t.update({box(x, 0)}, 0, 0.0));
    for (int f = 1; f <= 4; ++f) {
        x += 5 * f;
        s.update(t.update({box(x, 0)}, f, double(f)));
    }

    auto sp = s.speed(0);
    ASSERT_TRUE(sp.has_value());
    EXPECT_EQ(sp->samples, 3u);
    EXPECT_DOUBLE_EQ(sp->mps, 15.0);
}

TEST(SpeedAggregator, NoNewPointNoNewSample)
{
    Config cfg = make_config();
    cfg.tracker.max_disappeared_frames = 5;
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(1.0));

    s.update(t.update({box(0, 0)}, 0, 0.0));
    s.update(t.update({box(4, 0)}, 1, 1.0));
    EXPECT_EQ(s.update(t.update({}, 2, 2.0)), 0);
    EXPECT_EQ(s.update(t.update({}, 3, 3.0)), 0);
    EXPECT_EQ(s.speed(0)->samples, 1u);
}

TEST(SpeedAggregator, DiscardsNonMonotonicSample)
{
    Config cfg = make_config();
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(1.0));

    s.update(t.update({box(0, 0)}, 0, 1.0));
    EXPECT_EQ(s.update(t.update({box(5, 0)}, 1, 1.0)), 0);
    EXPECT_EQ(s.discarded_samples(), 1);
    EXPECT_FALSE(s.speed(0).has_value());

    // the track survives and the next sample is taken
    EXPECT_EQ(s.update(t.update({box(10, 0)}, 2, 2.0)), 1);
    ASSERT_TRUE(s.speed(0).has_value());
    EXPECT_DOUBLE_EQ(s.speed(0)->mps, 5.0);
}

TEST(SpeedAggregator, RetiredTrackKeepsFinalSpeed)
{
    Config cfg = make_config();
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(0.5));

    s.update(t.update({box(0, 0)}, 0, 0.0));
    s.update(t.update({box(20, 0)}, 1, 1.0));
    s.update(t.update({}, 2, 2.0));
    auto up = t.update({}, 3, 3.0);
    ASSERT_EQ(up.removed.size(), 1u);
    s.update(up);

    auto sp = s.speed(0);
    ASSERT_TRUE(sp.has_value());
    EXPECT_DOUBLE_EQ(sp->mps, 10.0);
    ASSERT_TRUE(s.average_kmh().has_value());
    EXPECT_DOUBLE_EQ(*s.average_kmh(), 36.0);
}

TEST(SpeedAggregator, FinalizeFreezesTrack)
{
    Config cfg = make_config();
    cfg.tracker.max_disappeared_frames = 5;
    Tracker t(cfg, kFrame);
    SpeedAggregator s(cfg, Calibrator(1.0));

    s.update(t.update({box(0, 0)}, 0, 0.0));
    s.update(t.update({box(10, 0)}, 1, 1.0));
    s.finalize(0);
    EXPECT_TRUE(s.finished(0));

    // still live in the tracker, but no further samples are taken
    EXPECT_EQ(s.update(t.update({box(40, 0)}, 2, 2.0)), 0);
    auto sp = s.speed(0);
    ASSERT_TRUE(sp.has_value());
    EXPECT_DOUBLE_EQ(sp->mps, 10.0);
    EXPECT_EQ(sp->samples, 1u);

    // finalizing twice, or an id never seen, is harmless
    s.finalize(0);
    s.finalize(99);
    EXPECT_FALSE(s.speed(99).has_value());
}
