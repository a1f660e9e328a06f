#pragma once
#include "Calibrator.hpp"
#include "Config.hpp"
#include "RollingWindow.hpp"
#include "Tracker.hpp"
#include <map>
#include <optional>
#include <set>

constexpr double kMpsToKmh = 3.6;

struct SpeedEstimate
{
    double      mps     = 0.0;
    double      kmh     = 0.0;
    std::size_t samples = 0;    // window entries behind the average
};

/*
 * Turns consecutive history points of each track into a smoothed speed.
 * Reads the Tracker's snapshot only; it never writes track state.
 */
class SpeedAggregator
{
public:
    SpeedAggregator(const Config& cfg, const Calibrator& calibrator);

    /** Samples every track that gained a point since the previous call. Returns samples added. */
    int update(const FrameUpdate& frame);

    /** Average of the window, or nullopt while no sample exists ("unknown"). */
    std::optional<SpeedEstimate> speed(int track_id) const;

    /** Mean km/h over every track with a known speed, live or retired. */
    std::optional<double> average_kmh() const;

    /**
     * Moves a track out of the live set, keeping its last estimate when it
     * has one. Later snapshots naming the id do not revive it.
     */
    void finalize(int track_id);

    bool finished(int track_id) const { return finished_.count(track_id) > 0; }
    int  discarded_samples() const { return discarded_; }

    /**
     * Speed between two history points in m/s. Throws
     * NonMonotonicTimestampError when time does not advance.
     */
    static double instantaneous_speed(const TrackPoint& prev, const TrackPoint& last,
                                      const Calibrator& calibrator);

private:
    struct State
    {
        RollingWindow<double> samples;
        int                   last_frame;
    };

    static SpeedEstimate estimate(const RollingWindow<double>& w);

    Calibrator                   calibrator_;
    std::size_t                  window_;
    std::map<int, State>         live_;
    std::map<int, SpeedEstimate> retired_;   // final estimate of removed tracks
    std::set<int>                finished_;
    int                          discarded_ = 0;
};
