#pragma once
#include "Tracker.hpp"
#include <unordered_set>
#include <utility>
#include <vector>

// Unique-vehicle count driven by crossing events. Redelivered events are ignored.
class Counter
{
public:
    /** Returns true if the event incremented the count. */
    bool on_crossing(const CrossingEvent& event);

    int  unique_count() const { return count_; }
    bool counted(int track_id) const { return counted_.count(track_id) > 0; }

    /** Vehicles per second over the session; 0 before any time has elapsed. */
    double rate(double elapsed_seconds) const;

    /**
     * Vehicles per minute from the counts recorded in [now - window, now].
     * With fewer than two distinct event times in the window, falls back
     * to the session total over the window length.
     */
    double rate_per_minute(double now, double window_seconds = 60.0) const;

    const std::vector<std::pair<double, int>>& history() const { return history_; }

private:
    int                                 count_ = 0;
    std::unordered_set<int>             counted_;
    std::vector<std::pair<double, int>> history_;   // (timestamp, count after event)
};
